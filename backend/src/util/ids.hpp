#pragma once
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <openssl/rand.h>

// Random hex string of `bytes` bytes from the OpenSSL CSPRNG.
inline std::string random_hex(std::size_t bytes = 16) {
    unsigned char buf[64];
    if (bytes > sizeof(buf)) bytes = sizeof(buf);
    if (RAND_bytes(buf, static_cast<int>(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    std::ostringstream os;
    for (std::size_t i = 0; i < bytes; ++i) {
        os << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(buf[i]);
    }
    return os.str();
}

// Record ids look like "esc-3f9a...". The prefix is only for humans reading logs.
inline std::string new_id(const char* prefix) {
    return std::string(prefix) + "-" + random_hex(12);
}
