#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace verifetch {
namespace download {

enum class TransferErrorCode {
    NONE = 0,

    CONNECTION_FAILED = 100,
    TRANSPORT_FAILED = 101,
    STREAM_INTERRUPTED = 102,

    HTTP_STATUS = 200,
    VALIDATION_REJECTED = 201,

    SIZE_BELOW_MINIMUM = 300,
    SIZE_ABOVE_MAXIMUM = 301,
    SIZE_MISMATCH = 302,

    RETRIES_EXHAUSTED = 400
};

using TransferErrorCodeHelper = common::ErrorRegistry<TransferErrorCode>;

}
}

namespace verifetch {
namespace common {

template<>
inline const std::unordered_map<download::TransferErrorCode, ErrorInfo<download::TransferErrorCode>>&
ErrorRegistry<download::TransferErrorCode>::getInfoMap() {
    using download::TransferErrorCode;
    static const std::unordered_map<TransferErrorCode, ErrorInfo<TransferErrorCode>> map = {
        {TransferErrorCode::NONE, {
            TransferErrorCode::NONE,
            "NONE",
            "No error"
        }},
        {TransferErrorCode::CONNECTION_FAILED, {
            TransferErrorCode::CONNECTION_FAILED,
            "CONNECTION_FAILED",
            "Could not connect to the server"
        }},
        {TransferErrorCode::TRANSPORT_FAILED, {
            TransferErrorCode::TRANSPORT_FAILED,
            "TRANSPORT_FAILED",
            "Request could not be issued"
        }},
        {TransferErrorCode::STREAM_INTERRUPTED, {
            TransferErrorCode::STREAM_INTERRUPTED,
            "STREAM_INTERRUPTED",
            "Response body was interrupted"
        }},
        {TransferErrorCode::HTTP_STATUS, {
            TransferErrorCode::HTTP_STATUS,
            "HTTP_STATUS",
            "Server returned an unusable status code"
        }},
        {TransferErrorCode::VALIDATION_REJECTED, {
            TransferErrorCode::VALIDATION_REJECTED,
            "VALIDATION_REJECTED",
            "Invalid response"
        }},
        {TransferErrorCode::SIZE_BELOW_MINIMUM, {
            TransferErrorCode::SIZE_BELOW_MINIMUM,
            "SIZE_BELOW_MINIMUM",
            "File size smaller than allowed minimum"
        }},
        {TransferErrorCode::SIZE_ABOVE_MAXIMUM, {
            TransferErrorCode::SIZE_ABOVE_MAXIMUM,
            "SIZE_ABOVE_MAXIMUM",
            "File size larger than allowed maximum"
        }},
        {TransferErrorCode::SIZE_MISMATCH, {
            TransferErrorCode::SIZE_MISMATCH,
            "SIZE_MISMATCH",
            "Received fewer bytes than declared"
        }},
        {TransferErrorCode::RETRIES_EXHAUSTED, {
            TransferErrorCode::RETRIES_EXHAUSTED,
            "RETRIES_EXHAUSTED",
            "Retry budget exhausted"
        }}
    };
    return map;
}

}}
