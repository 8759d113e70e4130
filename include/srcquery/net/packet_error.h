#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace SQ
{
	namespace Net
	{
		enum class PacketErrorKind
		{
			UnknownHeader,
			Underrun,
			IncompletePacket,
			DecompressionError,
			ChecksumMismatch,
			InvalidFrame,
			MalformedPacket
		};

		const char *PacketErrorKindName(PacketErrorKind kind);

		// Base of every failure raised while decoding, encoding or reassembling
		// packets. All of them are local to the call that raised them.
		class PacketError : public std::runtime_error
		{
		public:
			PacketError(PacketErrorKind kind, const std::string &what);

			PacketErrorKind Kind() const { return m_kind; }

			// True when the same input may succeed later (more fragments
			// arriving). Everything else means the data itself is bad.
			bool IsRetryable() const { return m_kind == PacketErrorKind::IncompletePacket; }
		private:
			PacketErrorKind m_kind;
		};

		class UnknownHeaderError : public PacketError
		{
		public:
			explicit UnknownHeaderError(uint8_t header);

			uint8_t Header() const { return m_header; }
		private:
			uint8_t m_header;
		};

		class UnderrunError : public PacketError
		{
		public:
			UnderrunError(size_t requested, size_t available);
			explicit UnderrunError(const std::string &what);

			size_t Requested() const { return m_requested; }
			size_t Available() const { return m_available; }
		private:
			size_t m_requested;
			size_t m_available;
		};

		class IncompletePacketError : public PacketError
		{
		public:
			IncompletePacketError(size_t missing_index, size_t fragment_count);

			size_t MissingIndex() const { return m_missing_index; }
		private:
			size_t m_missing_index;
		};

		class DecompressionError : public PacketError
		{
		public:
			explicit DecompressionError(const std::string &what);
		};

		class ChecksumMismatchError : public PacketError
		{
		public:
			ChecksumMismatchError(uint32_t expected, uint32_t actual);

			uint32_t Expected() const { return m_expected; }
			uint32_t Actual() const { return m_actual; }
		private:
			uint32_t m_expected;
			uint32_t m_actual;
		};

		class InvalidFrameError : public PacketError
		{
		public:
			explicit InvalidFrameError(uint32_t marker);
		};

		class MalformedPacketError : public PacketError
		{
		public:
			explicit MalformedPacketError(const std::string &what);
		};
	}
}
