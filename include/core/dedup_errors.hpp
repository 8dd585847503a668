#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Kinds of per-asset and per-pair failures collected during a run
 *
 * None of these abort a run; they are gathered into the report so that one
 * bad file never prevents the rest of the collection from being processed.
 */
enum class FailureKind
{
    DECODE_ERROR,       // container unreadable or without a decodable video stream
    EMPTY_SIGNATURE,    // no frame could be sampled and hashed
    INSUFFICIENT_DATA,  // too few aligned fingerprints to compare a pair
    RELOCATION_ERROR    // archive-phase filesystem failure
};

inline std::string failureKindName(FailureKind kind)
{
    switch (kind)
    {
    case FailureKind::DECODE_ERROR:
        return "DecodeError";
    case FailureKind::EMPTY_SIGNATURE:
        return "EmptySignatureError";
    case FailureKind::INSUFFICIENT_DATA:
        return "InsufficientDataError";
    case FailureKind::RELOCATION_ERROR:
        return "RelocationError";
    default:
        return "UnknownError";
    }
}

/**
 * @brief One failure entry of the run report
 */
struct ProcessingFailure
{
    std::string asset_id; // for pair failures: "<a> <-> <b>"
    FailureKind kind;
    std::string message;

    ProcessingFailure() : kind(FailureKind::DECODE_ERROR) {}
    ProcessingFailure(const std::string &id, FailureKind k, const std::string &msg)
        : asset_id(id), kind(k), message(msg) {}
};

/**
 * @brief Thrown when a frame source cannot open its container
 */
class DecodeError : public std::runtime_error
{
public:
    explicit DecodeError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief Invalid run configuration; the only error that is fatal to a whole run
 */
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string &message) : std::runtime_error(message) {}
};
