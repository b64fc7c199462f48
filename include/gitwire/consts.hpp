#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace gitwire::consts {

// Directory and file names
inline constexpr std::string_view kGitDir      = ".git";
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kPackDir     = "pack";
inline constexpr std::string_view kPackMagic   = "PACK";
inline constexpr std::string_view kRefsDir     = "refs";
inline constexpr std::string_view kIndexFile   = "index";
inline constexpr std::string_view kConfigFile  = "gitwire.conf";

// Git object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";
inline constexpr std::string_view kTypeTag     = "tag";

// File modes (octal)
inline constexpr std::uint32_t kModeFile    = 0100644; // regular file
inline constexpr std::uint32_t kModeExec    = 0100755; // executable file
inline constexpr std::uint32_t kModeSymlink = 0120000;
inline constexpr std::uint32_t kModeGitlink = 0160000; // submodule commit
inline constexpr std::uint32_t kModeTree    = 0040000; // directory entry in tree
inline constexpr std::uint32_t kModeTypeMask = 0170000;
inline constexpr std::uint32_t kModeRegular  = 0100000;

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .git/objects

// ——— Port number ———
inline constexpr int portNumber = 9418;

// ——— Packet lines ———
inline constexpr std::size_t kPktLenSize = 4;
inline constexpr std::size_t kMaxPktLen = 65520;                    // prefix included
inline constexpr std::size_t kMaxPktPayload = kMaxPktLen - kPktLenSize; // 65516
inline constexpr std::size_t kReadBufSize = 65536;

// ——— Capabilities ———
inline constexpr std::string_view kCapSideBand64k   = "side-band-64k";
inline constexpr std::string_view kCapOfsDelta      = "ofs-delta";
inline constexpr std::string_view kCapReportStatus  = "report-status";
inline constexpr std::string_view kCapMultiAck      = "multi_ack";
inline constexpr std::string_view kCapMultiAckDetailed = "multi_ack_detailed";
inline constexpr std::string_view kCapThinPack      = "thin-pack";

// ——— Services ———
inline constexpr std::string_view kUploadPack  = "upload-pack";
inline constexpr std::string_view kReceivePack = "receive-pack";

// ——— Index file ———
inline constexpr std::string_view kIndexMagic = "DIRC";
inline constexpr std::uint32_t kIndexVersion = 2;
inline constexpr std::uint16_t kIndexNameMask = 0x0fff;

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

// ——— Protocol tokens ———
inline constexpr std::string_view kTokWant     = "want ";
inline constexpr std::string_view kTokHave     = "have ";
inline constexpr std::string_view kTokDone     = "done\n";
inline constexpr std::string_view kTokAck      = "ACK";
inline constexpr std::string_view kTokErr      = "ERR";
inline constexpr std::string_view kUnpackOk    = "unpack ok";
inline constexpr std::string_view kStatusOk    = "ok ";
inline constexpr std::string_view kStatusNg    = "ng";
} // namespace gitwire::consts
