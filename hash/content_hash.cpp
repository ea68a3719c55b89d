// *****************************************************************************
// Content Hash Implementation
// *****************************************************************************

// Section 1: Includes
// C++ Standard Library
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

// Project Includes
#include "content_hash.h"
#include <sha2.h>

// Section 2: ContentHash Implementation
ContentHash::ContentHash()
{
    SHA256Init(&mCtx);
}

ContentHash::ContentHash(std::string_view data) : ContentHash()
{
    update(data.data(), data.size());
    finish();
}

void ContentHash::update(const void *data, size_t size)
{
    if ( mFinished || size == 0 )
        return;
    SHA256Update(&mCtx, static_cast<const uint8_t *>(data), size);
}

const ContentHash::Digest &ContentHash::finish()
{
    if ( !mFinished )
    {
        SHA256Final(mDigest.data(), &mCtx);
        mFinished = true;
    }
    return mDigest;
}

std::string ContentHash::to_string()
{
    finish();
    std::stringstream hashStream;
    hashStream << std::hex << std::setfill('0');
    for (auto byte : mDigest)
        hashStream << std::setw(2) << static_cast<unsigned>(byte);
    return hashStream.str();
}

std::string ContentHash::hex(std::string_view data)
{
    ContentHash hash(data);
    return hash.to_string();
}
