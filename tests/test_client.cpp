#include "test_framework.hpp"

#include "ses/client.hpp"
#include "ses/form_params.hpp"
#include "ses/internal/time.hpp"
#include "ses/log.hpp"

#include <atomic>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace {

// Records every request and answers with a canned response.
class MockTransport : public ses::Transport {
public:
    int status = 200;
    std::string body;
    bool fail = false;
    std::string fail_message = "connection refused";

    bool send(const ses::HttpRequest& req, ses::HttpResponse& out, std::string& err) override {
        {
            std::lock_guard<std::mutex> lk(mtx);
            requests.push_back(req);
        }
        if (fail) {
            err = fail_message;
            return false;
        }
        out.status_code = status;
        out.status_text = (status == 200) ? "OK" : "Error";
        out.body = body;
        return true;
    }

    std::size_t calls() {
        std::lock_guard<std::mutex> lk(mtx);
        return requests.size();
    }

    std::mutex mtx;
    std::vector<ses::HttpRequest> requests;
};

ses::ClientConfig test_config() {
    ses::ClientConfig cfg;
    cfg.creds.access_key_id = "a";
    cfg.creds.secret_access_key = "s";
    cfg.creds.region = "region";
    cfg.endpoint = "https://email.region.amazonaws.com";
    return cfg;
}

const char* kOkBody = "<SendEmailResponse>...</SendEmailResponse>";

} // namespace

void register_client_tests(std::vector<ses::tests::TestCase>& tests) {
    using ses::tests::require;
    using ses::tests::require_eq;

    tests.push_back({"client_send_email_success_returns_body_verbatim", [] {
        auto mock = std::make_shared<MockTransport>();
        mock->body = kOkBody;
        ses::Client cli(test_config(), mock);

        std::string out;
        ses::SendError err;
        require(cli.send_email("a@x.com", {"b@x.com"}, {}, {}, "subject", "text", out, err), err.message);
        require_eq(out, kOkBody, "result");
        require(err.kind == ses::ErrorKind::None, "error kind set on success");
        require(mock->calls() == 1, "exactly one transport call");

        const ses::HttpRequest& req = mock->requests.front();
        require_eq(req.method, "POST", "method");
        require_eq(req.url, "https://email.region.amazonaws.com", "url");
        require_eq(req.header("Content-Type"), "application/x-www-form-urlencoded", "content type");
        require(!req.header("Date").empty(), "Date header missing");

        const ses::FormParams f = ses::FormParams::decode(req.body);
        require_eq(f.get("Action"), "SendEmail", "Action");
        require_eq(f.get("Source"), "a@x.com", "Source");
        require_eq(f.get("Destination.ToAddresses.member.1"), "b@x.com", "To");
        require_eq(f.get("Message.Body.Text.Data"), "text", "text body");
        require_eq(f.get("AWSAccessKeyId"), "a", "AWSAccessKeyId");
        require(req.body.find("Destination.CcAddresses") == std::string::npos, "Cc present");
    }});

    tests.push_back({"client_authorization_has_scheme_and_scope", [] {
        auto mock = std::make_shared<MockTransport>();
        ses::Client cli(test_config(), mock);
        const std::time_t before = std::time(nullptr);

        std::string out;
        ses::SendError err;
        require(cli.send_email_html("from", {"to"}, {"cc"}, {"bcc"}, "s", "t", "<p>h</p>", out, err),
                err.message);
        const std::time_t after = std::time(nullptr);

        const std::string auth = mock->requests.front().header("Authorization");
        const std::string tail = "/region/email/aws4_request, "
                                 "SignedHeaders=content-type;date;host;x-amz-date, Signature=";
        bool matched = false;
        for (std::time_t t : {before, after}) {
            const std::string prefix = "AWS4-HMAC-SHA256 Credential=a/" + ses::internal::amz_day(t) + tail;
            if (auth.compare(0, prefix.size(), prefix) == 0) matched = true;
        }
        require(matched, "unexpected Authorization: " + auth);

        const ses::FormParams f = ses::FormParams::decode(mock->requests.front().body);
        require_eq(f.get("Message.Body.Html.Data"), "<p>h</p>", "html body");
        require_eq(f.get("Message.Body.Text.Data"), "t", "text body");
    }});

    tests.push_back({"client_aws3_scheme_uses_amzn_header", [] {
        auto mock = std::make_shared<MockTransport>();
        ses::ClientConfig cfg = test_config();
        cfg.scheme = ses::SignScheme::Aws3Https;
        ses::Client cli(cfg, mock);

        std::string out;
        ses::SendError err;
        require(cli.send_raw_email("raw", out, err), err.message);
        const ses::HttpRequest& req = mock->requests.front();
        const std::string want = "AWS3-HTTPS AWSAccessKeyId=a, Algorithm=HmacSHA256, Signature=";
        require(req.header("X-Amzn-Authorization").compare(0, want.size(), want) == 0,
                "X-Amzn-Authorization: " + req.header("X-Amzn-Authorization"));
        require(req.header("Authorization").empty(), "SigV4 header present");
    }});

    tests.push_back({"client_api_error_carries_status_and_body", [] {
        auto mock = std::make_shared<MockTransport>();
        mock->status = 400;
        mock->body = "{\"error\":\"message failed\"}";
        ses::Client cli(test_config(), mock);

        std::string out = "stale";
        ses::SendError err;
        require(!cli.send_email("a@x.com", {"b@x.com"}, {}, {}, "s", "b", out, err), "send succeeded");
        require(err.kind == ses::ErrorKind::Api, "kind");
        require(err.status_code == 400, "status");
        require_eq(err.body, "{\"error\":\"message failed\"}", "body");
        require(out.empty(), "result returned on failure");
    }});

    tests.push_back({"client_non_200_success_codes_are_errors", [] {
        auto mock = std::make_shared<MockTransport>();
        mock->status = 204;
        ses::Client cli(test_config(), mock);
        std::string out;
        ses::SendError err;
        require(!cli.send_raw_email("x", out, err), "204 accepted");
        require(err.kind == ses::ErrorKind::Api && err.status_code == 204, "kind/status");
    }});

    tests.push_back({"client_transport_error_is_not_retried", [] {
        auto mock = std::make_shared<MockTransport>();
        mock->fail = true;
        ses::Client cli(test_config(), mock);
        std::string out;
        ses::SendError err;
        require(!cli.send_raw_email("x", out, err), "send succeeded");
        require(err.kind == ses::ErrorKind::Transport, "kind");
        require_eq(err.message, "connection refused", "message");
        require(err.status_code == 0, "status set");
        require(mock->calls() == 1, "retried");
    }});

    tests.push_back({"client_bad_endpoint_fails_before_io", [] {
        auto mock = std::make_shared<MockTransport>();
        ses::ClientConfig cfg = test_config();
        cfg.endpoint = "email.region.amazonaws.com";
        ses::Client cli(cfg, mock);
        std::string out;
        ses::SendError err;
        require(!cli.send_raw_email("x", out, err), "send succeeded");
        require(err.kind == ses::ErrorKind::Construction, "kind");
        require(mock->calls() == 0, "transport called");
    }});

    tests.push_back({"client_missing_credentials_fail_before_io", [] {
        auto mock = std::make_shared<MockTransport>();
        ses::ClientConfig cfg = test_config();
        cfg.creds.secret_access_key.clear();
        ses::Client cli(cfg, mock);
        std::string out;
        ses::SendError err;
        require(!cli.send_email("a", {"b"}, {}, {}, "s", "b", out, err), "send succeeded");
        require(err.kind == ses::ErrorKind::Construction, "kind");
        require(mock->calls() == 0, "transport called");
    }});

    tests.push_back({"client_logs_go_to_the_process_log_file", [] {
        const std::string path = "ses_tests_client.log";
        std::remove(path.c_str());
        ses::set_log_file(path);

        auto mock = std::make_shared<MockTransport>();
        mock->fail = true;
        mock->fail_message = "reset by peer";
        ses::Client first(test_config(), mock);
        ses::ClientConfig other = test_config();
        other.creds.access_key_id = "other";
        ses::Client second(other, mock);

        std::string out;
        ses::SendError err;
        require(!first.send_raw_email("x", out, err), "send succeeded");
        ses::set_log_file("");

        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        std::remove(path.c_str());
        require(ss.str().find("[SES] transport error: reset by peer") != std::string::npos,
                "log file content: " + ss.str());
    }});

    tests.push_back({"client_bodies_identical_across_calls", [] {
        auto mock = std::make_shared<MockTransport>();
        ses::Client cli(test_config(), mock);
        const ses::SendIntent intent = ses::PlainTextEmail{"a@x.com", {"b@x.com", "c@x.com"}, {}, {"d@x.com"}, "s", "b"};
        std::string out;
        ses::SendError err;
        require(cli.send(intent, out, err) && cli.send(intent, out, err), err.message);
        require_eq(mock->requests[0].body, mock->requests[1].body, "encoded body");
    }});

    tests.push_back({"client_concurrent_sends_share_one_client", [] {
        auto mock = std::make_shared<MockTransport>();
        mock->body = kOkBody;
        ses::Client cli(test_config(), mock);

        std::atomic<int> ok{0};
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&cli, &ok, t] {
                for (int i = 0; i < 25; ++i) {
                    std::string out;
                    ses::SendError err;
                    const std::string to = "t" + std::to_string(t) + "@x.com";
                    if (cli.send_email("a@x.com", {to}, {}, {}, "s", "b", out, err) && out == kOkBody) ++ok;
                }
            });
        }
        for (auto& th : threads) th.join();
        require(ok.load() == 100, "not every concurrent send succeeded");
        require(mock->calls() == 100, "transport call count");
    }});
}
