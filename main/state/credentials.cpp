#include <main/state/credentials.hpp>
#include <cstring>

Credentials::Credentials() {
    wifi_ssid[0] = '\0';
    wifi_password[0] = '\0';
    aio_username[0] = '\0';
    aio_key[0] = '\0';
}

char* Credentials::fieldFor(const char* name, std::size_t& out_capacity) {
    if (name == nullptr) {
        return nullptr;
    }
    if (std::strcmp(name, "ssid") == 0) {
        out_capacity = sizeof(wifi_ssid);
        return wifi_ssid;
    }
    if (std::strcmp(name, "password") == 0) {
        out_capacity = sizeof(wifi_password);
        return wifi_password;
    }
    if (std::strcmp(name, "aio_username") == 0) {
        out_capacity = sizeof(aio_username);
        return aio_username;
    }
    if (std::strcmp(name, "aio_key") == 0) {
        out_capacity = sizeof(aio_key);
        return aio_key;
    }
    return nullptr;
}

bool Credentials::set(const char* name, const char* value) {
    std::size_t capacity = 0;
    char* field = fieldFor(name, capacity);
    if (field == nullptr || value == nullptr) {
        return false;
    }
    const std::size_t len = std::strlen(value);
    if (len >= capacity) {
        return false;
    }
    std::memcpy(field, value, len + 1);
    return true;
}

const char* Credentials::get(const char* name) const {
    std::size_t capacity = 0;
    return const_cast<Credentials*>(this)->fieldFor(name, capacity);
}

const char* Credentials::firstMissing() const {
    for (const char* name : kFieldNames) {
        const char* value = get(name);
        if (value == nullptr || value[0] == '\0') {
            return name;
        }
    }
    return nullptr;
}
