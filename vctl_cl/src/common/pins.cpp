/*
 * Part of the VpnCtl (VCTL) project.
 *
 * SPDX-FileCopyrightText: 2025 VpnCtl contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of VpnCtl (VCTL). See LICENSE for details.
 */

#include "vctl/pins.hpp"
#include "vctl/error.hpp"
#include "vctl/log.hpp"
#include "vctl/internal/utils.hpp"

#include <openssl/x509v3.h>
#include <openssl/crypto.h>

namespace vctl {

const PinTable& default_pin_table() {
    static const PinTable pins = {
        {"Hide.Me Root CA",                  "AdKh8rXi68jeqv5kEzF4wJ9M2R89gFuMILRQ1uwADQI="},
        {"Hide.Me Server CA #1",             "CsEyDelMHMPh9qLGgeQn8sJwdUwvc+fCMhOU9Ne5PbU="},
        {"DigiCert Global Root CA",          "r/mIkG3eEpVdm+u/ko/cwxzOMo1bk4TyHIlByibiA5E="},
        {"DigiCert TLS RSA SHA256 2020 CA1", "RQeZkB42znUfsDIIFWIRiYEcKl7nHwNFwWCrnMMJbVc="},
    };
    return pins;
}

PinVerifier::PinVerifier(PinTable pins) : _pins(std::move(pins)) {}

std::string PinVerifier::pin_of(X509* cert) {
    X509_PUBKEY* spki = X509_get_X509_PUBKEY(cert);
    if (!spki) return {};
    unsigned char* der = nullptr;
    const int len = i2d_X509_PUBKEY(spki, &der);
    if (len <= 0 || !der) return {};
    const std::string digest = internal::sha256_bin(der, (std::size_t)len);
    OPENSSL_free(der);
    return internal::base64_encode(digest);
}

std::string PinVerifier::common_name_of(X509* cert) {
    X509_NAME* subject = X509_get_subject_name(cert);
    if (!subject) return {};
    const int idx = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
    if (idx < 0) return {};
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, idx));
    if (!data) return {};
    unsigned char* utf8 = nullptr;
    const int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0 || !utf8) return {};
    std::string cn((const char*)utf8, (std::size_t)len);
    OPENSSL_free(utf8);
    return cn;
}

std::error_code PinVerifier::verify(const std::vector<std::vector<X509*>>& verified_chains) const {
    for (const auto& chain : verified_chains) {
        for (X509* cert : chain) {
            // Only basicConstraints cA:TRUE counts; v1 roots and bare keyCertSign do not.
            if (!cert || X509_check_ca(cert) != 1) continue;

            const std::string cn = common_name_of(cert);
            const std::string pin = pin_of(cert);
            auto it = _pins.find(cn);
            if (it != _pins.end() && !pin.empty() && it->second == pin) {
                log_line("[PINS] " + cn + " pin OK");
                continue;
            }
            log_line("[PINS] " + cn + " pin failed");
            return errc::bad_pin;
        }
    }
    return {};
}

std::error_code PinVerifier::verify_chain(STACK_OF(X509)* chain) const {
    if (!chain) return errc::bad_pin;
    std::vector<std::vector<X509*>> chains(1);
    const int n = sk_X509_num(chain);
    chains[0].reserve((std::size_t)n);
    for (int i = 0; i < n; ++i) chains[0].push_back(sk_X509_value(chain, i));
    return verify(chains);
}

} // namespace vctl
