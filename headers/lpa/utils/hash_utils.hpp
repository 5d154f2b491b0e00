//
// Created by gregorian-rayne on 1/13/26.
//

#ifndef LPA_HASH_UTILS_HPP
#define LPA_HASH_UTILS_HPP

#include <string>
#include <string_view>

namespace lpa::utils
{
    /**
     * Compute the SHA-256 hash of the input data.
     *
     * @param data The input bytes (text or binary) to hash.
     * @return A lowercase hexadecimal string representing the SHA-256 digest.
     * @throws std::runtime_error if the digest context cannot be created.
     */
    std::string compute_sha256(std::string_view data);

} // namespace lpa::utils

#endif //LPA_HASH_UTILS_HPP
