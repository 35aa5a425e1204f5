#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Encoder output, queued on the uploader
struct EncodedSegment {
    int  channel  = 0;
    int  take     = 0;
    int  sequence = 0;
    bool final    = false;
    std::string          contentType = "application/octet-stream";
    std::vector<uint8_t> bytes;
};

// Reported to the owning context once the server accepted a segment
struct UploadedSegment {
    int    channel  = 0;
    int    take     = 0;
    int    sequence = 0;
    bool   final    = false;
    size_t bytes    = 0;
    int    attempts = 0;
    std::string remoteId;   // "id" from the server's JSON reply, if any
};
