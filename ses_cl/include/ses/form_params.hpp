/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace ses {

// Ordered form fields with unique keys, serialized as
// application/x-www-form-urlencoded.
class FormParams {
public:
    // Sets key to value; an existing key keeps its position.
    void set(const std::string& key, const std::string& value);

    bool has(const std::string& key) const;
    // Empty string when absent.
    std::string get(const std::string& key) const;

    std::size_t size() const { return _fields.size(); }
    bool empty() const { return _fields.empty(); }

    // Insertion order.
    const std::vector<std::pair<std::string, std::string>>& fields() const { return _fields; }

    // "k1=v1&k2=v2" with keys sorted bytewise, space as '+', other
    // non-unreserved bytes as %XX.
    std::string encode() const;

    // Inverse of encode(); later duplicates overwrite earlier ones.
    static FormParams decode(const std::string& body);

private:
    std::vector<std::pair<std::string, std::string>> _fields;
};

} // namespace ses
