/*
 * Part of the SESmail project.
 *
 * SPDX-FileCopyrightText: 2025 SESmail contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SESmail. See LICENSE for details.
 */

#include "ses/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/crypto.h>

namespace ses::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string sha256_hex(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), d);
    return bytes_to_hex(d, SHA256_DIGEST_LENGTH);
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(s.data(), s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

std::string base64_encode(const std::string& bin){
    if (bin.empty()) return {};
    std::string out;
    out.resize(4 * ((bin.size() + 2) / 3) + 1); // + NUL written by OpenSSL
    const int n = EVP_EncodeBlock((unsigned char*)out.data(),
                                  (const unsigned char*)bin.data(), (int)bin.size());
    if (n < 0) return {};
    out.resize((std::size_t)n);
    return out;
}

bool base64_decode(const std::string& b64, std::string& out){
    out.clear();
    if (b64.empty()) return true;
    if (b64.size() % 4) return false;
    std::string buf;
    buf.resize(3 * (b64.size() / 4) + 1);
    const int n = EVP_DecodeBlock((unsigned char*)buf.data(),
                                  (const unsigned char*)b64.data(), (int)b64.size());
    if (n < 0) return false;
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t pad = 0;
    if (b64[b64.size()-1] == '=') ++pad;
    if (b64[b64.size()-2] == '=') ++pad;
    if ((std::size_t)n < pad) return false;
    buf.resize((std::size_t)n - pad);
    out.swap(buf);
    return true;
}

std::string uri_encode(const std::string& s, bool keep_slash){
    static const char* H="0123456789ABCDEF";
    std::string out; out.reserve(s.size()*3);
    for(unsigned char c: s){
        if (std::isalnum(c) || c=='-' || c=='.' || c=='_' || c=='~' || (keep_slash && c=='/')) {
            out.push_back((char)c);
        } else {
            out.push_back('%'); out.push_back(H[c>>4]); out.push_back(H[c&0xF]);
        }
    }
    return out;
}

std::string url_unescape(const std::string& s){
    std::string o; o.reserve(s.size());
    for(std::size_t i=0;i<s.size();++i){
        if(s[i]=='%' && i+2<s.size()){
            int hi=hexval(s[i+1]), lo=hexval(s[i+2]);
            if(hi>=0 && lo>=0){ o.push_back((char)((hi<<4)|lo)); i+=2; continue; }
        }
        o.push_back(s[i]=='+' ? ' ' : s[i]);
    }
    return o;
}

} // namespace ses::internal
