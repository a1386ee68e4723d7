#ifndef CREDENTIAL_STORE_HPP
#define CREDENTIAL_STORE_HPP

#include <main/state/credentials.hpp>

namespace CredentialStore {
    // Fill `out` from the compiled-in secrets, then let any string stored in
    // the NVS credentials namespace override each field. NVS must be
    // initialized. Returns false only if a stored value is unusable; missing
    // fields are reported by Credentials::firstMissing().
    bool load(Credentials& out);
}

#endif // CREDENTIAL_STORE_HPP
