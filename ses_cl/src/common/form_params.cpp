/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/form_params.hpp"
#include "ses/internal/utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

// application/x-www-form-urlencoded value escaping.
std::string form_escape(const std::string& s) {
    static const char* H = "0123456789ABCDEF";
    std::string out; out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back((char)c);
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%'); out.push_back(H[c >> 4]); out.push_back(H[c & 0xF]);
        }
    }
    return out;
}

} // namespace

namespace ses {

void FormParams::set(const std::string& key, const std::string& value) {
    for (auto& kv : _fields) {
        if (kv.first == key) { kv.second = value; return; }
    }
    _fields.emplace_back(key, value);
}

bool FormParams::has(const std::string& key) const {
    return std::any_of(_fields.begin(), _fields.end(),
                       [&](const auto& kv){ return kv.first == key; });
}

std::string FormParams::get(const std::string& key) const {
    for (const auto& kv : _fields) {
        if (kv.first == key) return kv.second;
    }
    return {};
}

std::string FormParams::encode() const {
    std::vector<const std::pair<std::string, std::string>*> v;
    v.reserve(_fields.size());
    for (const auto& kv : _fields) v.push_back(&kv);
    std::sort(v.begin(), v.end(), [](const auto* a, const auto* b){ return a->first < b->first; });

    std::ostringstream oss;
    bool first = true;
    for (const auto* kv : v) {
        if (!first) oss << '&';
        first = false;
        oss << form_escape(kv->first) << '=' << form_escape(kv->second);
    }
    return oss.str();
}

FormParams FormParams::decode(const std::string& body) {
    FormParams m;
    std::size_t p = 0;
    while (p < body.size()) {
        std::size_t amp = body.find('&', p);
        if (amp == std::string::npos) amp = body.size();
        const std::string pair = body.substr(p, amp - p);
        if (!pair.empty()) {
            const std::size_t eq = pair.find('=');
            if (eq == std::string::npos) m.set(ses::internal::url_unescape(pair), "");
            else m.set(ses::internal::url_unescape(pair.substr(0, eq)), ses::internal::url_unescape(pair.substr(eq + 1)));
        }
        p = amp + 1;
    }
    return m;
}

} // namespace ses
