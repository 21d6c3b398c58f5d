// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef LANPRINT_TRANSFER_ERROR_H
#define LANPRINT_TRANSFER_ERROR_H

#include <string>

namespace lanprint {

/**
 * @brief Failure reasons for a send request or a transfer session
 *
 * Every value except NONE is terminal for the session that produced it.
 */
enum class TransferErrorType {
    NONE,             // No error
    DEVICE_NOT_FOUND, // Device id absent from the discovery registry
    DEVICE_BUSY,      // A session is already active for this device
    UNREACHABLE,      // TCP connect to the device failed
    TIMEOUT,          // Operator did not answer the authorization prompt in time
    DENIED,           // Operator (or device) rejected the connection
    CONNECTION_LOST,  // Connection dropped after it was established
    CANCELLED,        // Caller cancelled the session
    PROTOCOL_ERROR    // Device answered with something we do not understand
};

/**
 * @brief Error information for orchestrator and session operations
 */
struct TransferError {
    TransferErrorType type = TransferErrorType::NONE;
    int code = 0;          // HTTP status code if applicable
    std::string message;   // Human-readable error message
    std::string operation; // Operation that caused the error

    bool has_error() const { return type != TransferErrorType::NONE; }

    std::string get_type_string() const { return type_name(type); }

    static const char* type_name(TransferErrorType type) {
        switch (type) {
            case TransferErrorType::NONE: return "NONE";
            case TransferErrorType::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
            case TransferErrorType::DEVICE_BUSY: return "DEVICE_BUSY";
            case TransferErrorType::UNREACHABLE: return "UNREACHABLE";
            case TransferErrorType::TIMEOUT: return "TIMEOUT";
            case TransferErrorType::DENIED: return "DENIED";
            case TransferErrorType::CONNECTION_LOST: return "CONNECTION_LOST";
            case TransferErrorType::CANCELLED: return "CANCELLED";
            case TransferErrorType::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief Actionable guidance for the end user
     *
     * Keeps "you said no" apart from "the network dropped".
     */
    std::string user_message() const {
        switch (type) {
            case TransferErrorType::DEVICE_NOT_FOUND:
                return "Printer not found. Make sure it is powered on and on the same network.";
            case TransferErrorType::DEVICE_BUSY:
                return "A file is already being sent to this printer.";
            case TransferErrorType::UNREACHABLE:
                return "Cannot reach the printer. Check the network connection and firewall.";
            case TransferErrorType::TIMEOUT:
                return "No answer on the touchscreen. Tap Yes on the printer and try again.";
            case TransferErrorType::DENIED:
                return "Connection was refused on the touchscreen. Re-authorize on the printer.";
            case TransferErrorType::CONNECTION_LOST:
                return "Connection to the printer was lost during the transfer.";
            case TransferErrorType::CANCELLED:
                return "Transfer cancelled.";
            case TransferErrorType::PROTOCOL_ERROR:
                if (!message.empty()) {
                    return "Unexpected reply from the printer: " + message;
                }
                return "Unexpected reply from the printer.";
            case TransferErrorType::NONE:
            default:
                return message;
        }
    }

    static TransferError make(TransferErrorType type, const std::string& operation,
                              const std::string& message, int code = 0) {
        TransferError err;
        err.type = type;
        err.operation = operation;
        err.message = message;
        err.code = code;
        return err;
    }

    static TransferError none() { return TransferError{}; }
};

} // namespace lanprint

#endif // LANPRINT_TRANSFER_ERROR_H
