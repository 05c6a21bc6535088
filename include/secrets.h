#ifndef SECRETS_H
#define SECRETS_H

// WiFi credentials
extern const char* ssid;
extern const char* password;

// Ruuvi Gateway: host (IP or name, optional :port) and bearer token.
// Leave the token empty for gateways without authentication.
extern const char* gatewayHost;
extern const char* gatewayToken;

#define GATEWAY_POLL_INTERVAL_MS 5000
#define GATEWAY_REQUEST_TIMEOUT_MS 4000
#define APP_LOG_LEVEL "DEBUG"

// Optional: Static IP configuration
#define USE_STATIC_IP 0
#define STATIC_IP IPAddress(192, 168, 1, 100)
#define GATEWAY IPAddress(192, 168, 1, 1)
#define SUBNET IPAddress(255, 255, 255, 0)

#endif
