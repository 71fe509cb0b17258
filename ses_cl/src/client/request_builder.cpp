/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/request_builder.hpp"
#include "ses/internal/utils.hpp"

namespace ses {
namespace {

void add_recipients(FormParams& data, const char* kind, const std::vector<std::string>& list) {
    // Indices are per list and 1-based.
    for (std::size_t i = 0; i < list.size(); ++i) {
        data.set(std::string("Destination.") + kind + "Addresses.member." + std::to_string(i + 1),
                 list[i]);
    }
}

void add_envelope(FormParams& data, const std::string& from,
                  const std::vector<std::string>& to,
                  const std::vector<std::string>& cc,
                  const std::vector<std::string>& bcc) {
    data.set("Source", from);
    add_recipients(data, "To", to);
    add_recipients(data, "Cc", cc);
    add_recipients(data, "Bcc", bcc);
}

struct FieldWriter {
    FormParams& data;

    void operator()(const PlainTextEmail& m) const {
        data.set("Action", "SendEmail");
        add_envelope(data, m.from, m.to, m.cc, m.bcc);
        data.set("Message.Subject.Data", m.subject);
        data.set("Message.Body.Text.Data", m.body);
    }

    void operator()(const HtmlEmail& m) const {
        data.set("Action", "SendEmail");
        add_envelope(data, m.from, m.to, m.cc, m.bcc);
        data.set("Message.Subject.Data", m.subject);
        data.set("Message.Body.Text.Data", m.text_body);
        data.set("Message.Body.Html.Data", m.html_body);
    }

    void operator()(const RawEmail& m) const {
        data.set("Action", "SendRawEmail");
        data.set("RawMessage.Data", internal::base64_encode(m.message));
    }
};

struct ActionName {
    const char* operator()(const PlainTextEmail&) const { return "SendEmail"; }
    const char* operator()(const HtmlEmail&) const { return "SendEmail"; }
    const char* operator()(const RawEmail&) const { return "SendRawEmail"; }
};

} // namespace

FormParams build_request(const SendIntent& intent, const std::string& access_key_id) {
    FormParams data;
    std::visit(FieldWriter{data}, intent);
    data.set("AWSAccessKeyId", access_key_id);
    return data;
}

const char* action_name(const SendIntent& intent) {
    return std::visit(ActionName{}, intent);
}

} // namespace ses
