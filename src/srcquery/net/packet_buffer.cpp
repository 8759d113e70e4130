#include "srcquery/net/packet_buffer.h"
#include "srcquery/net/packet_error.h"

#include <algorithm>
#include <cstring>
#include <utility>

SQ::Net::PacketBuffer::PacketBuffer()
	: m_position(0)
{
}

SQ::Net::PacketBuffer::PacketBuffer(Bytes data)
	: m_data(std::move(data)), m_position(0)
{
}

SQ::Net::PacketBuffer::PacketBuffer(const uint8_t *data, size_t size)
	: m_data(data, data + size), m_position(0)
{
}

void SQ::Net::PacketBuffer::CheckRemaining(size_t count) const
{
	if (count > Remaining()) {
		throw UnderrunError(count, Remaining());
	}
}

uint8_t SQ::Net::PacketBuffer::ReadUInt8()
{
	CheckRemaining(1);
	return m_data[m_position++];
}

uint16_t SQ::Net::PacketBuffer::ReadUInt16()
{
	CheckRemaining(2);
	uint16_t value = static_cast<uint16_t>(m_data[m_position] | (m_data[m_position + 1] << 8));
	m_position += 2;
	return value;
}

uint16_t SQ::Net::PacketBuffer::ReadUInt16BE()
{
	CheckRemaining(2);
	uint16_t value = static_cast<uint16_t>((m_data[m_position] << 8) | m_data[m_position + 1]);
	m_position += 2;
	return value;
}

uint32_t SQ::Net::PacketBuffer::ReadUInt32()
{
	CheckRemaining(4);
	uint32_t value = static_cast<uint32_t>(m_data[m_position]) |
		(static_cast<uint32_t>(m_data[m_position + 1]) << 8) |
		(static_cast<uint32_t>(m_data[m_position + 2]) << 16) |
		(static_cast<uint32_t>(m_data[m_position + 3]) << 24);
	m_position += 4;
	return value;
}

int32_t SQ::Net::PacketBuffer::ReadInt32()
{
	return static_cast<int32_t>(ReadUInt32());
}

uint64_t SQ::Net::PacketBuffer::ReadUInt64()
{
	CheckRemaining(8);
	uint64_t value = 0;
	for (int i = 0; i < 8; i++) {
		value |= static_cast<uint64_t>(m_data[m_position + i]) << (i * 8);
	}
	m_position += 8;
	return value;
}

float SQ::Net::PacketBuffer::ReadFloat()
{
	uint32_t bits = ReadUInt32();
	float value;
	memcpy(&value, &bits, sizeof(float));
	return value;
}

std::string SQ::Net::PacketBuffer::ReadCString()
{
	auto begin = m_data.begin() + static_cast<std::ptrdiff_t>(m_position);
	auto terminator = std::find(begin, m_data.end(), 0);
	if (terminator == m_data.end()) {
		throw UnderrunError("Packet underrun: string is not null-terminated");
	}

	std::string result(begin, terminator);
	m_position += result.size() + 1;
	return result;
}

SQ::Bytes SQ::Net::PacketBuffer::ReadBytes(size_t count)
{
	CheckRemaining(count);
	auto begin = m_data.begin() + static_cast<std::ptrdiff_t>(m_position);
	Bytes result(begin, begin + static_cast<std::ptrdiff_t>(count));
	m_position += count;
	return result;
}

SQ::Bytes SQ::Net::PacketBuffer::ReadRemaining()
{
	return ReadBytes(Remaining());
}

void SQ::Net::PacketBuffer::WriteUInt8(uint8_t value)
{
	m_data.push_back(value);
}

void SQ::Net::PacketBuffer::WriteUInt16(uint16_t value)
{
	m_data.push_back(value & 0xFF);
	m_data.push_back((value >> 8) & 0xFF);
}

void SQ::Net::PacketBuffer::WriteUInt16BE(uint16_t value)
{
	m_data.push_back((value >> 8) & 0xFF);
	m_data.push_back(value & 0xFF);
}

void SQ::Net::PacketBuffer::WriteUInt32(uint32_t value)
{
	m_data.push_back(value & 0xFF);
	m_data.push_back((value >> 8) & 0xFF);
	m_data.push_back((value >> 16) & 0xFF);
	m_data.push_back((value >> 24) & 0xFF);
}

void SQ::Net::PacketBuffer::WriteInt32(int32_t value)
{
	WriteUInt32(static_cast<uint32_t>(value));
}

void SQ::Net::PacketBuffer::WriteUInt64(uint64_t value)
{
	for (int i = 0; i < 8; i++) {
		m_data.push_back((value >> (i * 8)) & 0xFF);
	}
}

void SQ::Net::PacketBuffer::WriteFloat(float value)
{
	uint32_t bits;
	memcpy(&bits, &value, sizeof(float));
	WriteUInt32(bits);
}

void SQ::Net::PacketBuffer::WriteCString(std::string_view value)
{
	m_data.insert(m_data.end(), value.begin(), value.end());
	m_data.push_back(0);
}

void SQ::Net::PacketBuffer::WriteBytes(const Bytes &data)
{
	m_data.insert(m_data.end(), data.begin(), data.end());
}

void SQ::Net::PacketBuffer::WriteBytes(const uint8_t *data, size_t size)
{
	m_data.insert(m_data.end(), data, data + size);
}

SQ::Bytes SQ::Net::PacketBuffer::Release()
{
	Bytes out;
	out.swap(m_data);
	m_position = 0;
	return out;
}
