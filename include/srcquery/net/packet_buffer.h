#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace SQ
{
	using Bytes = std::vector<uint8_t>;

	namespace Net
	{
		/*
		 * Sequential cursor over the payload of one packet.
		 *
		 * Reads consume bytes from the current position and throw UnderrunError
		 * instead of moving past the end. Writes always append. Integers are
		 * little-endian unless the method name ends in BE.
		 */
		class PacketBuffer
		{
		public:
			PacketBuffer();
			explicit PacketBuffer(Bytes data);
			PacketBuffer(const uint8_t *data, size_t size);

			uint8_t ReadUInt8();
			uint16_t ReadUInt16();
			uint16_t ReadUInt16BE();
			uint32_t ReadUInt32();
			int32_t ReadInt32();
			uint64_t ReadUInt64();
			float ReadFloat();
			// Null-terminated string; the terminator is consumed, not returned.
			std::string ReadCString();
			Bytes ReadBytes(size_t count);
			Bytes ReadRemaining();

			void WriteUInt8(uint8_t value);
			void WriteUInt16(uint16_t value);
			void WriteUInt16BE(uint16_t value);
			void WriteUInt32(uint32_t value);
			void WriteInt32(int32_t value);
			void WriteUInt64(uint64_t value);
			void WriteFloat(float value);
			void WriteCString(std::string_view value);
			void WriteBytes(const Bytes &data);
			void WriteBytes(const uint8_t *data, size_t size);

			size_t Position() const { return m_position; }
			size_t Remaining() const { return m_data.size() - m_position; }
			bool HasRemaining() const { return m_position < m_data.size(); }
			size_t Length() const { return m_data.size(); }
			const Bytes &Data() const { return m_data; }
			Bytes Release();

		private:
			void CheckRemaining(size_t count) const;

			Bytes m_data;
			size_t m_position;
		};
	}
}
