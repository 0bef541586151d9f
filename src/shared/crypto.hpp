#pragma once

#include <openssl/sha.h>
#include <string>
#include <vector>

namespace Crypto {

    /**
     * Computes the SHA256 hash of the given bytes, as a lowercase hex string.
     */
    std::string sha256Hex(const std::vector<unsigned char>& input);
}

namespace CryptoTests
{
    void testSha256Hex();
    void runAll();
}
