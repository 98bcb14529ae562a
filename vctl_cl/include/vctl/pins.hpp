/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#pragma once
#include <map>
#include <string>
#include <system_error>
#include <vector>
#include <openssl/x509.h>

namespace vctl {

// CA common name -> base64(SHA-256(DER SubjectPublicKeyInfo)).
using PinTable = std::map<std::string, std::string>;

// Authorized service and DigiCert CAs.
const PinTable& default_pin_table();

// Checks public key pins of CA certificates in verified chains.
// Holds only an immutable table, so concurrent handshakes may share one instance.
class PinVerifier {
public:
    explicit PinVerifier(PinTable pins);

    // Every CA certificate of every chain must match the table by common
    // name and pin; the first mismatch fails with errc::bad_pin.
    // Leaf certificates are skipped.
    std::error_code verify(const std::vector<std::vector<X509*>>& verified_chains) const;

    // Same check over the single chain OpenSSL built for a handshake.
    std::error_code verify_chain(STACK_OF(X509)* chain) const;

    const PinTable& pins() const { return _pins; }

    static std::string pin_of(X509* cert);
    static std::string common_name_of(X509* cert);

private:
    PinTable _pins;
};

} // namespace vctl
