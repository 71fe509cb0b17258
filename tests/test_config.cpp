#include "test_framework.hpp"

#include "ses/client_config.hpp"

#include <cstdlib>
#include <optional>

namespace {

struct EnvGuard {
    std::string key;
    std::optional<std::string> old_value;

    EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
        if (const char* existing = std::getenv(key.c_str()); existing != nullptr) {
            old_value = existing;
        }
        if (value.has_value()) {
            setenv(key.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

    ~EnvGuard() {
        if (old_value.has_value()) {
            setenv(key.c_str(), old_value->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }
};

} // namespace

void register_config_tests(std::vector<ses::tests::TestCase>& tests) {
    using ses::tests::require;
    using ses::tests::require_eq;

    tests.push_back({"env_config_reads_standard_variables", [] {
        EnvGuard id("AWS_ACCESS_KEY_ID", "AKID");
        EnvGuard secret("AWS_SECRET_KEY", " s3cret ");
        EnvGuard alt("AWS_SECRET_ACCESS_KEY", "other");
        EnvGuard region("AWS_REGION", "eu-west-1");
        EnvGuard endpoint("AWS_SES_ENDPOINT", "http://localhost:4579");

        ses::ClientConfig cfg;
        std::string err;
        require(ses::load_env_config(cfg, err), err);
        require_eq(cfg.creds.access_key_id, "AKID", "key id");
        require_eq(cfg.creds.secret_access_key, "s3cret", "secret (trimmed, AWS_SECRET_KEY first)");
        require_eq(cfg.creds.region, "eu-west-1", "region");
        require_eq(cfg.endpoint, "http://localhost:4579", "endpoint");
    }});

    tests.push_back({"env_config_derives_regional_endpoint", [] {
        EnvGuard id("AWS_ACCESS_KEY_ID", "AKID");
        EnvGuard secret("AWS_SECRET_KEY", std::nullopt);
        EnvGuard alt("AWS_SECRET_ACCESS_KEY", "alt-secret");
        EnvGuard region("AWS_REGION", "us-west-2");
        EnvGuard endpoint("AWS_SES_ENDPOINT", std::nullopt);

        ses::ClientConfig cfg;
        std::string err;
        require(ses::load_env_config(cfg, err), err);
        require_eq(cfg.creds.secret_access_key, "alt-secret", "fallback secret");
        require_eq(cfg.endpoint, "https://email.us-west-2.amazonaws.com", "endpoint");
    }});

    tests.push_back({"env_config_keeps_programmatic_values", [] {
        EnvGuard id("AWS_ACCESS_KEY_ID", "from-env");
        EnvGuard secret("AWS_SECRET_KEY", "env-secret");
        EnvGuard region("AWS_REGION", "us-east-1");
        EnvGuard endpoint("AWS_SES_ENDPOINT", std::nullopt);

        ses::ClientConfig cfg;
        cfg.creds.access_key_id = "explicit";
        cfg.endpoint = "https://ses.example.test";
        std::string err;
        require(ses::load_env_config(cfg, err), err);
        require_eq(cfg.creds.access_key_id, "explicit", "key id");
        require_eq(cfg.creds.secret_access_key, "env-secret", "secret");
        require_eq(cfg.endpoint, "https://ses.example.test", "endpoint");
    }});

    tests.push_back({"env_config_reports_missing_values", [] {
        EnvGuard id("AWS_ACCESS_KEY_ID", std::nullopt);
        EnvGuard secret("AWS_SECRET_KEY", std::nullopt);
        EnvGuard alt("AWS_SECRET_ACCESS_KEY", std::nullopt);
        EnvGuard region("AWS_REGION", std::nullopt);
        EnvGuard endpoint("AWS_SES_ENDPOINT", std::nullopt);

        ses::ClientConfig cfg;
        std::string err;
        require(!ses::load_env_config(cfg, err), "empty environment accepted");
        require(err.find("AWS_ACCESS_KEY_ID") != std::string::npos, "error: " + err);
    }});

    tests.push_back({"validate_config_rules", [] {
        ses::ClientConfig cfg;
        cfg.creds = {"id", "secret", ""};
        cfg.endpoint = "https://email.us-east-1.amazonaws.com";
        std::string err;
        require(!ses::validate_config(cfg, err), "SigV4 without region accepted");
        require(err.find("region") != std::string::npos, "error: " + err);

        cfg.scheme = ses::SignScheme::Aws3Https;
        require(ses::validate_config(cfg, err), "AWS3 without region rejected: " + err);

        cfg.endpoint = "https//broken";
        require(!ses::validate_config(cfg, err), "broken endpoint accepted");
    }});
}
