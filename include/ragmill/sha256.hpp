#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace ragmill::crypto {

    /**
     * @brief Incremental SHA-256 (FIPS 180-4). Digests are lowercase hex.
     */
    class SHA256 {
    public:
        SHA256();

        void update(const void* data, size_t len);
        void update(std::string_view data) { update(data.data(), data.size()); }

        /**
         * @brief Finishes the digest. The hasher is reset afterwards.
         */
        std::string final();

        static std::string hash_bytes(std::string_view data);

        /**
         * @brief Hashes a file's raw bytes.
         * @return Empty string if the file cannot be read.
         */
        static std::string hash_file(const std::filesystem::path& path);

    private:
        uint32_t m_state[8];
        uint8_t m_block[64];
        size_t m_block_len;
        uint64_t m_total_bits;

        void reset();
        void compress(const uint8_t* block);
    };

}
