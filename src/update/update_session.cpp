#include "update/update_session.hpp"

#include "io/gzip_reader.hpp"
#include "update/digest_tracker.hpp"
#include "util/logger.hpp"

#include <utility>

namespace geoupdate {

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Polling:       return "polling";
        case SessionState::Decompressing: return "decompressing";
        case SessionState::Done:          return "done";
        case SessionState::Failed:        return "failed";
    }
    return "unknown";
}

UpdateSession::UpdateSession(Params params)
    : params_(std::move(params)), current_digest_(params_.initial_digest) {}

PollRequest UpdateSession::NextPoll(const Credential& credential) const {
    PollRequest req;
    req.db_md5 = current_digest_;
    req.challenge_md5 = params_.challenge;
    req.user_id = credential.account_id;
    req.edition_id = params_.product_id;
    return req;
}

Result UpdateSession::ExpectState(SessionState expected, const char* op) const {
    if (state_ != expected) {
        return Result::ProtocolError(std::string(op) + " not allowed in state " + ToString(state_));
    }
    return Result::Ok();
}

void UpdateSession::Fail(Result error) {
    compressed_.clear();
    failure_ = std::move(error);
    state_ = SessionState::Failed;
}

Result UpdateSession::OnReply(ServerReply reply) {
    if (auto r = ExpectState(SessionState::Polling, "OnReply"); !r.is_ok()) return r;

    switch (reply.kind) {
        case ReplyKind::NoUpdate:
            if (HasPayload()) {
                LogInfo("Update retrieved for %s after %d round(s)",
                        params_.remote_filename.c_str(), attempt_count_);
            } else {
                LogInfo("No new updates available for %s", params_.remote_filename.c_str());
            }
            state_ = SessionState::Done;
            return Result::Ok();

        case ReplyKind::Malformed:
            Fail(Result::ProtocolError("unexpected payload format"));
            return Result::Ok();

        case ReplyKind::GzipPayload:
            ++attempt_count_;
            if (attempt_count_ > kMaxRounds) {
                Fail(Result::ProtocolError("too many rounds"));
                return Result::Ok();
            }
            LogDebug("Round %d for %s: %zu compressed bytes",
                     attempt_count_, params_.remote_filename.c_str(), reply.payload.size());
            compressed_ = std::move(reply.payload);
            state_ = SessionState::Decompressing;
            return Result::Ok();
    }

    return Result::ProtocolError("unknown reply kind");
}

Result UpdateSession::OnPollError(Result error) {
    if (auto r = ExpectState(SessionState::Polling, "OnPollError"); !r.is_ok()) return r;
    if (error.is_ok()) {
        return Result::ProtocolError("OnPollError called without an error");
    }
    Fail(std::move(error));
    return Result::Ok();
}

Result UpdateSession::Decompress() {
    if (auto r = ExpectState(SessionState::Decompressing, "Decompress"); !r.is_ok()) return r;

    std::vector<std::uint8_t> plain;
    auto res = Gunzip(std::move(compressed_), plain, params_.max_payload_bytes);
    compressed_.clear();
    if (!res.is_ok()) {
        Fail(Result::ProtocolError("payload decompression failed: " + res.message()));
        return Result::Ok();
    }

    // Each round replaces the previous payload; nothing is merged.
    latest_payload_ = std::move(plain);
    current_digest_ = DigestOfBytes(latest_payload_);
    state_ = SessionState::Polling;
    return Result::Ok();
}

Result UpdateSession::Run(IUpdateService& service, const Credential& credential) {
    while (!Finished()) {
        Result step;
        if (state_ == SessionState::Polling) {
            std::vector<std::uint8_t> body;
            auto poll_res = service.PollSecure(NextPoll(credential), body);
            step = poll_res.is_ok() ? OnReply(ServerReply::Classify(std::move(body)))
                                    : OnPollError(std::move(poll_res));
        } else {
            step = Decompress();
        }
        if (!step.is_ok()) {
            Fail(std::move(step));
        }
    }

    return state_ == SessionState::Done ? Result::Ok() : failure_;
}

} // namespace geoupdate
