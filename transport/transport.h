// *****************************************************************************
// Transport Contract
// *****************************************************************************

#ifndef _TRANSPORT_H_
#define _TRANSPORT_H_

// Section 1: Includes
// C++ Standard Library
#include <cstdint>
#include <string>

// Project Includes
#include "error_codes.h"
#include "manifest.pb.h"
#include "sync_types.h"

// Section 2: Types
/**
 * One upload request. A file below the chunking threshold is a single part
 * with chunkCount 1.
 */
struct UploadPart {
    std::string path;           ///< /module/relative/path
    std::string content;        ///< this part's bytes, compressed if encoding is set
    std::string hash;           ///< hash of the whole uncompressed file
    std::string encoding;       ///< "gzip" or empty
    uint64_t size = 0;          ///< uncompressed size of the whole file
    int64_t mtime = 0;
    uint32_t chunkIndex = 0;
    uint32_t chunkCount = 1;
};

struct DownloadResult {
    std::string content;
    std::string encoding;       ///< Content-Encoding of the response, "gzip" or empty
};

// Section 3: Class Definition
/**
 * Request/response operations against the remote peer. Every call returns a
 * SyncError: SYNC_ERR_AUTH for rejected credentials, SYNC_ERR_NETWORK for
 * anything that did not produce a usable answer.
 */
class Transport
{
public:
    virtual ~Transport() = default;

    virtual SyncError login(const std::string &username, const std::string &password, std::string &token) = 0;
    virtual SyncError ping() = 0;
    virtual SyncError check(const com::workspacesync::Manifest &local, com::workspacesync::CheckResponse &response) = 0;
    virtual SyncError upload(const UploadPart &part) = 0;
    virtual SyncError download(const std::string &path, DownloadResult &result) = 0;
    virtual SyncError resolveConflict(const std::string &conflictId, Resolution resolution) = 0;

    virtual void setToken(const std::string &token) = 0;

    /**
     * Identifies this client on every request that follows
     */
    virtual void setPeerId(const std::string &peerId) = 0;
};

#endif // _TRANSPORT_H_
