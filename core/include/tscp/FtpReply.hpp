// FTP control-channel codec: reply assembly (RFC 959 multi-line replies),
// PASV/PWD/FEAT parsing, MLSD/MLST facts and reply code classification.
#pragma once
#include "HostTypes.hpp"
#include <cstdint>
#include <string>

namespace tscp {
namespace ftp {

struct Reply {
    int code = 0;
    std::string text;  // every line without code prefix, '\n' separated

    int category() const { return code / 100; }
    bool preliminary() const { return category() == 1; }
    bool positive() const { return category() == 2; }
    bool intermediate() const { return category() == 3; }
};

// Assembles one reply from control lines ("\r\n" already removed).
class ReplyParser {
public:
    enum class Status { NeedMore, Complete, Malformed };

    Status feed(const std::string& line);
    const Reply& reply() const { return reply_; }
    void reset();

private:
    Reply reply_;
    bool multiline_ = false;
};

// "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
bool parsePasv(const std::string& text, std::string& host, std::uint16_t& port);

// Servers behind NAT advertise private or zero addresses; the control
// connection's peer is used instead.
std::string choosePassiveHost(const std::string& advertised, const std::string& controlPeer);
bool isUnroutableAddress(const std::string& ipv4);

// '257 "/path" is current directory' (embedded quotes are doubled)
bool parsePwd(const std::string& text, std::string& path);

struct Features {
    bool mlst = false;  // implies MLSD
    bool mdtm = false;
    bool mfmt = false;
    bool size = false;
    bool utf8 = false;
};

Features parseFeat(const std::string& text);

// One MLSD line or the fact line of an MLST reply:
// "type=file;size=4;modify=20170113063314;UNIX.mode=0600; readme.txt".
// cdir/pdir entries come back with name "." or "..".
bool parseFactLine(const std::string& line, const std::string& dir, RemoteEntry& out);

// "YYYYMMDDHHMMSS[.sss]" (UTC) as used by MLSx modify, MDTM and MFMT.
bool parseFactTime(const std::string& s, std::int64_t& out);
std::string formatFactTime(std::int64_t epoch);

// Maps a negative reply to the error taxonomy. 530 is Auth during login and
// Permission afterwards.
ErrorKind replyKind(const Reply& reply, bool duringLogin);

} // namespace ftp
} // namespace tscp
