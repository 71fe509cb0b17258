#include "test_framework.hpp"

#include "ses/form_params.hpp"
#include "ses/internal/hmac.hpp"
#include "ses/internal/sigv4.hpp"
#include "ses/internal/time.hpp"
#include "ses/internal/url.hpp"
#include "ses/internal/utils.hpp"

namespace {

std::string hex(const std::string& bin) {
    return ses::internal::bytes_to_hex((const unsigned char*)bin.data(), bin.size());
}

} // namespace

void register_form_tests(std::vector<ses::tests::TestCase>& tests) {
    using ses::tests::require;
    using ses::tests::require_eq;
    namespace in = ses::internal;

    tests.push_back({"form_encode_sorts_keys_and_escapes", [] {
        ses::FormParams f;
        f.set("Source", "a@x.com");
        f.set("Action", "SendEmail");
        f.set("Message.Subject.Data", "hi there/ok?&=");
        require_eq(f.encode(),
                   "Action=SendEmail&Message.Subject.Data=hi+there%2Fok%3F%26%3D&Source=a%40x.com",
                   "encoded body");
    }});

    tests.push_back({"form_set_replaces_existing_key_in_place", [] {
        ses::FormParams f;
        f.set("b", "1");
        f.set("a", "2");
        f.set("b", "3");
        require(f.size() == 2, "duplicate key added");
        require_eq(f.fields()[0].first, "b", "first key");
        require_eq(f.get("b"), "3", "replaced value");
        require(!f.has("c") && f.get("c").empty(), "missing key");
    }});

    tests.push_back({"form_decode_inverts_encode", [] {
        ses::FormParams f;
        f.set("Message.Body.Text.Data", "line 1\nline 2 \xc3\xa9 100%");
        f.set("Empty", "");
        const ses::FormParams back = ses::FormParams::decode(f.encode());
        require_eq(back.get("Message.Body.Text.Data"), "line 1\nline 2 \xc3\xa9 100%", "body");
        require(back.has("Empty") && back.get("Empty").empty(), "empty value");
    }});

    tests.push_back({"uri_encode_keeps_unreserved_only", [] {
        require_eq(in::uri_encode("a-b_c.d~e f/g+"), "a-b_c.d~e%20f%2Fg%2B", "query style");
        require_eq(in::uri_encode("/a b/c", true), "/a%20b/c", "path style");
    }});

    tests.push_back({"url_unescape_decodes_form_and_query_escapes", [] {
        require_eq(in::url_unescape("a+b%2Fc%2f%zz%4"), "a b/c/%zz%4", "mixed escapes");
        require_eq(in::url_unescape("%E2%82%AC"), "\xe2\x82\xac", "utf-8 bytes");
        require_eq(ses::FormParams::decode("k%20y=v+1%26").get("k y"), "v 1&", "form decode");
        require_eq(in::canonical_query("q=%2a+x"), "q=%2A%20x", "query decode");
    }});

    tests.push_back({"base64_known_values", [] {
        require_eq(in::base64_encode(""), "", "empty");
        require_eq(in::base64_encode("f"), "Zg==", "f");
        require_eq(in::base64_encode("fo"), "Zm8=", "fo");
        require_eq(in::base64_encode("foobar"), "Zm9vYmFy", "foobar");
        std::string out;
        require(in::base64_decode("Zm8=", out) && out == "fo", "decode padded");
        require(!in::base64_decode("Zm8", out), "bad length accepted");
        require(!in::base64_decode("Zm!=", out), "bad alphabet accepted");
    }});

    tests.push_back({"sha256_and_hmac_vectors", [] {
        require_eq(in::sha256_hex(""),
                   "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256('')");
        std::string mac;
        require(in::hmac_sha256_bin("Jefe", "what do ya want for nothing?", mac), "hmac failed");
        require_eq(hex(mac), "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843",
                   "RFC 4231 case 2");
    }});

    tests.push_back({"date_formats_are_utc", [] {
        require_eq(in::http_date(0), "Thu, 01 Jan 1970 00:00:00 +0000", "epoch");
        require_eq(in::http_date(1440938160), "Sun, 30 Aug 2015 12:36:00 +0000", "http date");
        require_eq(in::amz_date(1440938160), "20150830T123600Z", "amz date");
        require_eq(in::amz_day(1440938160), "20150830", "amz day");
    }});

    tests.push_back({"url_parse_splits_components", [] {
        in::Url u;
        std::string err;
        require(in::parse_url("https://email.us-east-1.amazonaws.com", u, err), err);
        require_eq(u.scheme, "https", "scheme");
        require_eq(u.host, "email.us-east-1.amazonaws.com", "host");
        require(u.port == 443 && !u.explicit_port, "default port");
        require_eq(u.path, "/", "path");
        require_eq(in::host_header(u), "email.us-east-1.amazonaws.com", "host header");

        require(in::parse_url("HTTP://127.0.0.1:8080/ses/v1?x=1#frag", u, err), err);
        require_eq(u.scheme, "http", "lowercased scheme");
        require(u.port == 8080 && u.explicit_port, "explicit port");
        require_eq(u.path, "/ses/v1", "path");
        require_eq(u.query, "x=1", "query");
        require_eq(in::host_header(u), "127.0.0.1:8080", "host header with port");

        require(in::parse_url("http://[::1]:9000/", u, err), err);
        require_eq(u.host, "::1", "ipv6 host");
        require_eq(in::host_header(u), "[::1]:9000", "ipv6 host header");

        require(in::parse_url("https://h:443", u, err), err);
        require_eq(in::host_header(u), "h", "default port dropped");
    }});

    tests.push_back({"url_parse_rejects_malformed", [] {
        in::Url u;
        std::string err;
        require(!in::parse_url("", u, err), "empty accepted");
        require(!in::parse_url("email.amazonaws.com", u, err), "no scheme accepted");
        require(!in::parse_url("ftp://host/", u, err), "ftp accepted");
        require(!in::parse_url("https:///path", u, err), "empty host accepted");
        require(!in::parse_url("https://host:0/", u, err), "port 0 accepted");
        require(!in::parse_url("https://host:99999/", u, err), "port overflow accepted");
        require(!in::parse_url("https://host:8a/", u, err), "non numeric port accepted");
    }});
}
