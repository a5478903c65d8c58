#pragma once

#include "net/update_service.hpp"
#include "update/identity.hpp"
#include "update/server_reply.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geoupdate {

enum class SessionState {
    Polling,
    Decompressing,
    Done,
    Failed,
};

const char* ToString(SessionState state);

// Poll loop for a single product.
//
//   Polling --NoUpdate--> Done
//   Polling --Malformed / poll error--> Failed
//   Polling --GzipPayload--> Decompressing   (Failed once rounds exceed kMaxRounds)
//   Decompressing --ok--> Polling            (payload and digest replaced)
//   Decompressing --corrupt--> Failed
//
// OnReply/OnPollError/Decompress perform exactly one transition and do no
// network I/O; Run drives them against an IUpdateService.
class UpdateSession {
public:
    static constexpr int kMaxRounds = 5;
    // Upper bound on one round's decompressed payload.
    static constexpr std::uint64_t kMaxPayloadBytes = 2ULL * 1024 * 1024 * 1024;

    struct Params {
        std::string product_id;
        std::string remote_filename;
        std::string initial_digest;
        std::string challenge;
        std::uint64_t max_payload_bytes = kMaxPayloadBytes;
    };

    explicit UpdateSession(Params params);

    SessionState State() const { return state_; }
    bool Finished() const { return state_ == SessionState::Done || state_ == SessionState::Failed; }

    const std::string& ProductId() const { return params_.product_id; }
    const std::string& RemoteFilename() const { return params_.remote_filename; }
    const std::string& Challenge() const { return params_.challenge; }
    const std::string& CurrentDigest() const { return current_digest_; }
    int AttemptCount() const { return attempt_count_; }

    // Decompressed content of the most recent round; empty until one succeeds.
    const std::vector<std::uint8_t>& LatestPayload() const { return latest_payload_; }
    bool HasPayload() const { return !latest_payload_.empty(); }
    std::vector<std::uint8_t> TakePayload() { return std::move(latest_payload_); }

    // The error that moved the session to Failed.
    const Result& Failure() const { return failure_; }

    PollRequest NextPoll(const Credential& credential) const;

    Result OnReply(ServerReply reply);
    Result OnPollError(Result error);
    Result Decompress();

    // Runs until Done or Failed. Returns Ok for Done, Failure() otherwise.
    Result Run(IUpdateService& service, const Credential& credential);

private:
    Result ExpectState(SessionState expected, const char* op) const;
    void Fail(Result error);

    Params params_;
    SessionState state_ = SessionState::Polling;
    std::string current_digest_;
    int attempt_count_ = 0;
    std::vector<std::uint8_t> latest_payload_;
    std::vector<std::uint8_t> compressed_;
    Result failure_;
};

} // namespace geoupdate
