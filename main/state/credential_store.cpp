#include <main/state/credential_store.hpp>
#include <main/config/config.hpp>
#include <main/secrets.hpp>
#include <main/utils/logger.hpp>
#include <nvs_flash.h>
#include <nvs.h>

static const char* TAG = "CREDENTIALS";

namespace {
    static bool loadDefaults(Credentials& out) {
        bool ok = true;
        ok &= out.set("ssid", Secrets::WIFI_SSID);
        ok &= out.set("password", Secrets::WIFI_PASSWORD);
        ok &= out.set("aio_username", Secrets::AIO_USERNAME);
        ok &= out.set("aio_key", Secrets::AIO_KEY);
        if (!ok) {
            LOG_ERROR(TAG, "%s", "Compiled-in secret too long");
        }
        return ok;
    }

    static bool applyNvsOverrides(Credentials& out) {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(Config::Provisioning::nvs_namespace, NVS_READONLY, &handle);
        if (err == ESP_ERR_NVS_NOT_FOUND) {
            // Nothing provisioned
            return true;
        }
        if (err != ESP_OK) {
            LOG_WARN(TAG, "NVS open failed: %d", static_cast<int>(err));
            return true;
        }

        bool ok = true;
        for (const char* name : Credentials::kFieldNames) {
            char value[72];
            size_t len = sizeof(value);
            err = nvs_get_str(handle, name, value, &len);
            if (err == ESP_ERR_NVS_NOT_FOUND) {
                continue;
            }
            if (err != ESP_OK) {
                LOG_ERROR(TAG, "NVS read of '%s' failed: %d", name, static_cast<int>(err));
                ok = false;
                continue;
            }
            if (!out.set(name, value)) {
                LOG_ERROR(TAG, "Provisioned '%s' is too long", name);
                ok = false;
                continue;
            }
            LOG_INFO(TAG, "Using provisioned '%s'", name);
        }
        nvs_close(handle);
        return ok;
    }
}

namespace CredentialStore {
    bool load(Credentials& out) {
        bool ok = loadDefaults(out);
        ok &= applyNvsOverrides(out);
        return ok;
    }
}
