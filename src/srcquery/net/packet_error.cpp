#include "srcquery/net/packet_error.h"
#include <fmt/format.h>

const char *SQ::Net::PacketErrorKindName(PacketErrorKind kind)
{
	switch (kind) {
	case PacketErrorKind::UnknownHeader:
		return "UnknownHeader";
	case PacketErrorKind::Underrun:
		return "Underrun";
	case PacketErrorKind::IncompletePacket:
		return "IncompletePacket";
	case PacketErrorKind::DecompressionError:
		return "DecompressionError";
	case PacketErrorKind::ChecksumMismatch:
		return "ChecksumMismatch";
	case PacketErrorKind::InvalidFrame:
		return "InvalidFrame";
	case PacketErrorKind::MalformedPacket:
		return "MalformedPacket";
	}
	return "Unknown";
}

SQ::Net::PacketError::PacketError(PacketErrorKind kind, const std::string &what)
	: std::runtime_error(what), m_kind(kind)
{
}

SQ::Net::UnknownHeaderError::UnknownHeaderError(uint8_t header)
	: PacketError(PacketErrorKind::UnknownHeader,
		fmt::format("Unknown packet with header {:#04x} received", header)),
	m_header(header)
{
}

SQ::Net::UnderrunError::UnderrunError(size_t requested, size_t available)
	: PacketError(PacketErrorKind::Underrun,
		fmt::format("Packet underrun: needed {} byte(s), {} available", requested, available)),
	m_requested(requested), m_available(available)
{
}

SQ::Net::UnderrunError::UnderrunError(const std::string &what)
	: PacketError(PacketErrorKind::Underrun, what), m_requested(0), m_available(0)
{
}

SQ::Net::IncompletePacketError::IncompletePacketError(size_t missing_index, size_t fragment_count)
	: PacketError(PacketErrorKind::IncompletePacket,
		fmt::format("Split packet incomplete: fragment {} of {} missing", missing_index, fragment_count)),
	m_missing_index(missing_index)
{
}

SQ::Net::DecompressionError::DecompressionError(const std::string &what)
	: PacketError(PacketErrorKind::DecompressionError, what)
{
}

SQ::Net::ChecksumMismatchError::ChecksumMismatchError(uint32_t expected, uint32_t actual)
	: PacketError(PacketErrorKind::ChecksumMismatch,
		fmt::format("CRC32 checksum mismatch of uncompressed packet data: expected {:#010x}, got {:#010x}", expected, actual)),
	m_expected(expected), m_actual(actual)
{
}

SQ::Net::InvalidFrameError::InvalidFrameError(uint32_t marker)
	: PacketError(PacketErrorKind::InvalidFrame,
		fmt::format("Datagram does not start with the single packet marker (got {:#010x})", marker))
{
}

SQ::Net::MalformedPacketError::MalformedPacketError(const std::string &what)
	: PacketError(PacketErrorKind::MalformedPacket, what)
{
}
