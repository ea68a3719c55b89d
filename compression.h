// *****************************************************************************
// Compression Helpers
// *****************************************************************************

#ifndef _COMPRESSION_H_
#define _COMPRESSION_H_

// Section 1: Includes
#include <string>
#include <string_view>

// Section 2: Declarations
namespace Compression
{
    /**
     * Compresses a buffer into gzip framing (RFC 1952)
     * @param input Raw bytes
     * @param output Receives the gzip stream
     * @return 0 on success, negative on zlib failure
     */
    int gzip(std::string_view input, std::string &output);

    /**
     * Inflates a gzip stream
     * @param input gzip bytes
     * @param output Receives the raw bytes
     * @return 0 on success, negative on corrupt or truncated input
     */
    int gunzip(std::string_view input, std::string &output);

    /**
     * Checks the gzip magic bytes
     */
    bool looksGzipped(std::string_view input);
};

#endif  // _COMPRESSION_H_
