/*
 * Part of the SigProxy (SP) project.
 *
 * SPDX-FileCopyrightText: 2025 SigProxy contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SigProxy (SP). See LICENSE for details.
 */

#include "sp/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <openssl/evp.h>

namespace sp::internal {

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

bool hex_to_bytes(const std::string& hex, std::string& out){
    if(hex.size() % 2) return false;
    out.clear(); out.reserve(hex.size()/2);
    for(std::size_t i=0;i<hex.size(); i+=2){
        int h=hexval(hex[i]); int l=hexval(hex[i+1]);
        if(h<0 || l<0) return false;
        out.push_back((char)((h<<4)|l));
    }
    return true;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

bool is_hex_string(const std::string& s){
    if (s.empty() || s.size() % 2) return false;
    return std::all_of(s.begin(), s.end(), [](char c){ return hexval(c) >= 0; });
}

std::string base64_encode(const std::string& data){
    if (data.empty()) return {};
    std::string out;
    out.resize(4 * ((data.size() + 2) / 3));
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<std::size_t>(n));
    return out;
}

std::string base64url_encode(const std::string& data){
    std::string s = base64_encode(data);
    while (!s.empty() && s.back() == '=') s.pop_back();
    for (char& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return s;
}

bool base64url_decode(const std::string& in, std::string& out){
    out.clear();
    if (in.empty()) return true;
    // A single leftover sextet cannot encode a byte
    if (in.size() % 4 == 1) return false;

    std::string s;
    s.reserve(in.size() + 3);
    for (char c : in) {
        if (c == '-') s.push_back('+');
        else if (c == '_') s.push_back('/');
        else if (std::isalnum((unsigned char)c)) s.push_back(c);
        else return false; // padding and the standard alphabet are not accepted
    }
    std::size_t pad = 0;
    while (s.size() % 4) { s.push_back('='); ++pad; }

    out.resize(s.size() / 4 * 3);
    const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(s.data()),
                                  static_cast<int>(s.size()));
    if (n < 0 || static_cast<std::size_t>(n) < pad) {
        out.clear();
        return false;
    }
    // EVP_DecodeBlock counts the padding as zero bytes
    out.resize(static_cast<std::size_t>(n) - pad);
    return true;
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool iequals(const std::string& a, const std::string& b){
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

} // namespace sp::internal
