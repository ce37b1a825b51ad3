#pragma once

// Dialog IDs
#define IDD_MAIN_DIALOG                 101

// Control IDs
#define IDC_BROWSE_BUTTON               1001
#define IDC_PATH_EDIT                   1002
#define IDC_AREA_SELECT_BUTTON          1005
#define IDC_CAPTURE_START_BUTTON        1006
#define IDC_CLOSE_BUTTON                1007
#define IDC_EXPORT_PDF_BUTTON           1008
#define IDC_SCALE_COMBO                 1009
#define IDC_QUALITY_COMBO               1010
#define IDC_PDF_SIZE_COMBO              1011
#define IDC_LOG_EDIT                    1012
#define IDC_AUTO_CLICK_CHECKBOX         1013
#define IDC_AUTO_CLICK_INTERVAL_COMBO   1014
#define IDC_AUTO_CLICK_COUNT_EDIT       1015

// Static labels
#define IDC_STATIC_FOLDER               1020
#define IDC_STATIC_SCALE                1021
#define IDC_STATIC_QUALITY              1022
#define IDC_STATIC_PDF_SIZE             1023
#define IDC_STATIC_INTERVAL             1024
#define IDC_STATIC_COUNT                1025
#define IDC_GRP_CAPTURE                 1030
#define IDC_GRP_AUTO_CLICK              1031
#define IDC_GRP_LOG                     1032
