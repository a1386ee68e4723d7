// Compiled-in credential defaults. Keep real values out of version control:
// fill these in locally, or provision them into NVS namespace "secrets"
// (keys "ssid", "password", "aio_username", "aio_key"), which takes precedence.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "";
    static constexpr const char* WIFI_PASSWORD = "";
    static constexpr const char* AIO_USERNAME = "";
    static constexpr const char* AIO_KEY = "";
}

#endif // SECRETS_HPP
