// SPDX-License-Identifier: MIT
// Part of SigProxy (SP) project.
// apps/sp_url.cpp

#include "sp/internal/url_codec.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " -e <url> [--hex] [--prefix http://proxy.example] [--key KEY]\n"
      "  " << argv0 << " -d <proxy url or /<sig>/<url> path> [--key KEY]\n"
      "\n"
      "The key defaults to the SP_HMAC_KEY environment variable.\n";
}

// "/<sig>/<url>" at the end of a full proxy URL or path.
static bool split_tail(const std::string& s, std::string& sig, std::string& url) {
    std::string p = s;
    const std::size_t q = p.find('?');
    if (q != std::string::npos) p.erase(q);
    const std::size_t last = p.rfind('/');
    if (last == std::string::npos || last == 0) return false;
    const std::size_t prev = p.rfind('/', last - 1);
    if (prev == std::string::npos) return false;
    sig = p.substr(prev + 1, last - prev - 1);
    url = p.substr(last + 1);
    return !sig.empty() && !url.empty();
}

int main(int argc, char** argv) {
    std::string key, encode_arg, decode_arg, prefix;
    bool hex = false;
    if (const char* k = std::getenv("SP_HMAC_KEY")) key = k;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-e" && i+1 < argc) encode_arg = argv[++i];
        else if (a == "-d" && i+1 < argc) decode_arg = argv[++i];
        else if (a == "--key" && i+1 < argc) key = argv[++i];
        else if (a == "--prefix" && i+1 < argc) prefix = argv[++i];
        else if (a == "--hex") hex = true;
        else { usage(argv[0]); return 2; }
    }
    if (key.empty() || encode_arg.empty() == decode_arg.empty()) {
        usage(argv[0]);
        return 2;
    }

    if (!encode_arg.empty()) {
        while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
        const std::string path = hex ? sp::internal::encode_url_hex(key, encode_arg)
                                     : sp::internal::encode_url_b64(key, encode_arg);
        std::cout << prefix << path << "\n";
        return 0;
    }

    std::string sig, url;
    if (!split_tail(decode_arg, sig, url)) {
        std::cerr << "not a proxy url: " << decode_arg << "\n";
        return 1;
    }
    const auto dr = sp::internal::decode_url(key, sig, url);
    if (!dr.ok) {
        std::cerr << "decode failed: " << sp::internal::signature_error_name(dr.error) << "\n";
        return 1;
    }
    std::cout << dr.url << "\n";
    return 0;
}
