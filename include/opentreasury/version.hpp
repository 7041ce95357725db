#pragma once

/**
 * @file version.hpp
 * @brief OpenTreasury version and protocol constants
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace opentreasury {

/// Tool version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Protocol constants (embedded in every document and memo)
constexpr const char* kProtocolName = "OpenTreasury";
constexpr const char* kStandard = "OTMS";
constexpr int kStandardVersion = 1;

/// Cluster written into documents when none is configured
constexpr const char* kDefaultCluster = "devnet";

/// Public memo program that records instruction data as text
constexpr const char* kMemoProgramId = "MemoSq4gqABAXKb96qnH8TysNcWxMyWCqXgDLGmfcHr";

/// Number of recent signatures fetched for an account overview
constexpr int kDefaultSignatureLimit = 50;

}  // namespace opentreasury
