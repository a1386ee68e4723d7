#ifndef CREDENTIALS_HPP
#define CREDENTIALS_HPP

#include <cstddef>

// Network and broker secrets as name/value pairs:
// "ssid", "password", "aio_username", "aio_key".
// Fixed-size storage; values are copied in.
class Credentials {
public:
    static constexpr std::size_t kFieldCount = 4;
    static constexpr const char* kFieldNames[kFieldCount] = {
        "ssid", "password", "aio_username", "aio_key"
    };

    Credentials();

    // False for unknown names, null values, or values that do not fit.
    bool set(const char* name, const char* value);
    // Null for unknown names.
    const char* get(const char* name) const;

    // Name of the first empty field, or nullptr if all are present.
    const char* firstMissing() const;

    const char* ssid() const { return wifi_ssid; }
    const char* password() const { return wifi_password; }
    const char* aioUsername() const { return aio_username; }
    const char* aioKey() const { return aio_key; }

private:
    char* fieldFor(const char* name, std::size_t& out_capacity);

    char wifi_ssid[33];     // 802.11 max SSID length + NUL
    char wifi_password[65]; // WPA2 passphrase max + NUL
    char aio_username[65];
    char aio_key[65];
};

#endif // CREDENTIALS_HPP
