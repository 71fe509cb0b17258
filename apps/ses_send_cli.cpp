// SPDX-License-Identifier: Apache-2.0
// Part of the SESmail project.
// apps/ses_send_cli.cpp

#include "ses/client.hpp"
#include "ses/client_config.hpp"
#include "ses/log.hpp"

#include <algorithm>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --from ADDR --to ADDR [--to ADDR ...] [--cc ADDR] [--bcc ADDR]\n"
      "      --subject TEXT --text BODY [--html BODY]\n"
      "  " << argv0 << " --raw FILE\n"
      "\n"
      "Credentials come from AWS_ACCESS_KEY_ID and AWS_SECRET_KEY; the endpoint\n"
      "from AWS_SES_ENDPOINT or AWS_REGION. Overrides:\n"
      "  --endpoint URL            SES endpoint, e.g. https://email.us-east-1.amazonaws.com\n"
      "  --region REGION           signing region\n"
      "  --scheme v4|v3            signature scheme (default v4)\n"
      "  --tls_ca FILE             CA bundle for the endpoint certificate\n"
      "  --insecure 0|1            skip TLS peer verification (default 0)\n"
      "  --connect_timeout <sec>   TCP connect timeout in seconds (default 10)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 10)\n"
      "  --log FILE                append log lines to FILE\n";
}

static bool read_file(const std::string& path, std::string& out){
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

int main(int argc, char** argv){
    // A peer reset during SSL_write must surface as an error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    ses::ClientConfig cfg;

    std::string from, subject, text, html, raw_file;
    std::vector<std::string> to, cc, bcc;
    bool have_text = false, have_html = false;
    std::string endpoint, region, schemeS, log_file;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--from" && i+1<argc) from = argv[++i];
            else if(a=="--to" && i+1<argc) to.push_back(argv[++i]);
            else if(a=="--cc" && i+1<argc) cc.push_back(argv[++i]);
            else if(a=="--bcc" && i+1<argc) bcc.push_back(argv[++i]);
            else if(a=="--subject" && i+1<argc) subject = argv[++i];
            else if(a=="--text" && i+1<argc) { text = argv[++i]; have_text = true; }
            else if(a=="--html" && i+1<argc) { html = argv[++i]; have_html = true; }
            else if(a=="--raw" && i+1<argc) raw_file = argv[++i];
            else if(a=="--endpoint" && i+1<argc) endpoint = argv[++i];
            else if(a=="--region" && i+1<argc) region = argv[++i];
            else if(a=="--scheme" && i+1<argc) schemeS = argv[++i];
            else if(a=="--tls_ca" && i+1<argc) cfg.tls_ca_file = argv[++i];
            else if(a=="--insecure" && i+1<argc) cfg.tls_verify_peer = (std::stoi(argv[++i])==0);
            else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc) cfg.io_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--log" && i+1<argc) log_file = argv[++i];
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "Bad numeric argument: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    // The log file is process-wide, so only the app sets it.
    if(!log_file.empty()) ses::set_log_file(log_file);

    if(schemeS=="v3") cfg.scheme = ses::SignScheme::Aws3Https;
    else if(schemeS.empty() || schemeS=="v4") cfg.scheme = ses::SignScheme::SigV4;
    else { usage(argv[0]); return 2; }

    // Flags win over the environment.
    cfg.creds.region = region;
    cfg.endpoint = endpoint;
    std::string err;
    if(!ses::load_env_config(cfg, err)){
        std::cerr<<"Configuration error: "<<err<<"\n";
        return 2;
    }

    ses::SendIntent intent;
    if(!raw_file.empty()){
        std::string raw;
        if(!read_file(raw_file, raw)){
            std::cerr<<"Cannot read --raw file: "<<raw_file<<"\n";
            return 2;
        }
        intent = ses::RawEmail{raw};
    } else {
        if(from.empty() || to.empty() || !have_text){
            usage(argv[0]);
            return 2;
        }
        if(have_html) intent = ses::HtmlEmail{from, to, cc, bcc, subject, text, html};
        else          intent = ses::PlainTextEmail{from, to, cc, bcc, subject, text};
    }

    ses::Client cli(cfg);
    std::string body;
    ses::SendError serr;
    if(!cli.send(intent, body, serr)){
        std::cerr<<"send failed ("<<ses::to_string(serr.kind)<<")";
        if(serr.kind==ses::ErrorKind::Api) std::cerr<<": HTTP "<<serr.status_code<<"\n"<<serr.body<<"\n";
        else std::cerr<<": "<<serr.message<<"\n";
        return 1;
    }
    std::cout<<body<<"\n";
    return 0;
}
