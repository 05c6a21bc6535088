#include "secrets.h"

const char* ssid = "your-ssid";
const char* password = "your-password";

const char* gatewayHost = "192.168.1.50";
const char* gatewayToken = "";
