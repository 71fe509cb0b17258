/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#pragma once
#include <string>
#include "ses/form_params.hpp"
#include "ses/send_intent.hpp"

namespace ses {

// Maps a send intent onto the SES query API fields:
//   SendEmail:    Action, Source, Destination.{To,Cc,Bcc}Addresses.member.N,
//                 Message.Subject.Data, Message.Body.Text.Data[, Message.Body.Html.Data]
//   SendRawEmail: Action, RawMessage.Data (base64)
// plus AWSAccessKeyId. Pure: same input, same output.
FormParams build_request(const SendIntent& intent, const std::string& access_key_id);

// Provider action name for the intent ("SendEmail" / "SendRawEmail").
const char* action_name(const SendIntent& intent);

} // namespace ses
