#include <openssl/sha.h>
#include <string>
#include <sstream>
#include <iomanip>
#include <iostream>

#include "crypto.hpp"
#include "test_utils.hpp"

namespace Crypto {

    #pragma GCC diagnostic ignored "-Wdeprecated-declarations"
    /**
     * Computes the SHA256 hash of the given bytes, as a lowercase hex string.
     */
    std::string sha256Hex(const std::vector<unsigned char>& input) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256_CTX sha256;

        SHA256_Init(&sha256);
        SHA256_Update(&sha256, input.data(), input.size());
        SHA256_Final(hash, &sha256);

        std::ostringstream oss;
        for (int i = 0; i < SHA256_DIGEST_LENGTH; i++)
            oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);

        return oss.str();
    }
}

////////////////////////////////////////////
// Crypto tests
////////////////////////////////////////////
namespace CryptoTests
{
    void testSha256Hex()
    {
        std::vector<unsigned char> empty;
        ASSERT_THAT(Crypto::sha256Hex(empty) == 
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

        std::string abc = "abc";
        std::vector<unsigned char> abcBytes(abc.begin(), abc.end());
        ASSERT_THAT(Crypto::sha256Hex(abcBytes) == 
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    void runAll()
    {
        std::cerr << "###################################" << std::endl;
        std::cerr << "Crypto Tests" << std::endl;
        std::cerr << "###################################" << std::endl;

        std::vector<std::pair<std::string, std::function<void()>>> tests = {
            TEST(testSha256Hex)
        };

        for (auto &[name, func] : tests)
        {
            TestUtils::runTest(name, func);
        }
    }
}
