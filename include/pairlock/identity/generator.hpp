#pragma once

#include <string>

#include "pairlock/core/constants.hpp"
#include "pairlock/core/result.hpp"
#include "pairlock/crypto/random.hpp"
#include "pairlock/identity/key_pair.hpp"
#include "pairlock/mnemonic/phrase.hpp"

namespace pairlock::identity {

    // RSA key generation driven entirely by `source` (algorithm v1):
    //   each prime of k = bits/2 bits starts from k/8 drawn bytes with the top two bits and
    //   the low bit forced, then steps by 2 until it is not 1 mod 65537 and passes
    //   BN_check_prime; a candidate that outgrows k bits triggers a fresh draw. The second
    //   prime is redrawn while |p - q| <= 2^(k-100). With p > q, e = 65537 and
    //   d = e^-1 mod lcm(p-1, q-1).
    // Fed a ChaCha20Stream, the output is a pure function of the stream key.
    Result<KeyPair> generate_rsa(crypto::RandomSource &source, int bits);

    class IdentityGenerator {
      public:
        explicit IdentityGenerator(crypto::RandomSource &random = crypto::system_random(),
                                   int random_bits = constants::RANDOM_IDENTITY_BITS);

        // Long-term device identity. Expensive: keep off latency sensitive paths.
        Result<KeyPair> generate_random() const;

        // 8 words -> 2048 bit pair. Initial contact tier, not long-term secrecy.
        Result<KeyPair> generate_from_contact_phrase(const mnemonic::WordPhrase &words) const;

        // 16 words (contact code + secret code) -> 4096 bit pair
        Result<KeyPair> generate_from_full_phrase(const mnemonic::WordPhrase &words) const;

        int random_bits() const { return random_bits_; }

      private:
        Result<KeyPair> generate_from_phrase(const mnemonic::WordPhrase &words, int bits) const;

        crypto::RandomSource &random_;
        int random_bits_;
    };

    Result<std::string> public_key_from_private(const std::string &private_pem);

    // Modulus size of a public or private PEM key
    Result<int> key_bits(const std::string &pem);

} // namespace pairlock::identity
