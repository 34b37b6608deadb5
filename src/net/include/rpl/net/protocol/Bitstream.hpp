// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.hpp
/// @brief Bit-level serialization stream for replication messages.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rpl/core/Types.hpp>
#include <rpl/core/Expected.hpp>
#include <rpl/core/NonCopyable.hpp>

#include <cstddef>
#include <span>
#include <vector>

namespace rpl::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class Bitstream
/// @brief Compact bit-level read/write stream.
///
/// Values are stored big-endian in the bit buffer.  Floats travel as their
/// IEEE-754 bit pattern so a reader reproduces the writer's value exactly.
// /////////////////////////////////////////////////////////////////////////////
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    /// @brief Constructs an empty writable bitstream.
    Bitstream() noexcept;

    /// @brief Constructs a read-only bitstream from existing data.
    /// @param data   Raw bytes.
    /// @param bitCount Number of valid bits in @p data.
    Bitstream(std::span<const core::byte> data, core::u32 bitCount) noexcept;

    Bitstream(Bitstream &&) noexcept;
    Bitstream &operator=(Bitstream &&) noexcept;

    ~Bitstream();

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Writes @p bitCount bits from @p value.
    /// @param value    Value to write (only lower @p bitCount bits are used).
    /// @param bitCount Number of bits to write (1 to 32).
    void writeBits(core::u32 value, core::u32 bitCount);

    /// @brief Writes a boolean (1 bit).
    void writeBool(bool value);

    /// @brief Writes an unsigned 8-bit value.
    void writeU8(core::u8 value);

    /// @brief Writes an unsigned 16-bit value.
    void writeU16(core::u16 value);

    /// @brief Writes an unsigned 32-bit value.
    void writeU32(core::u32 value);

    /// @brief Writes a 32-bit float (bit pattern).
    void writeF32(core::f32 value);

    /// @brief Writes raw bytes.
    void writeBytes(std::span<const core::byte> bytes);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    /// @brief Reads @p bitCount bits as an unsigned value.
    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);

    /// @brief Reads a boolean.
    [[nodiscard]] core::Expected<bool> readBool();

    /// @brief Reads an unsigned 8-bit value.
    [[nodiscard]] core::Expected<core::u8> readU8();

    /// @brief Reads an unsigned 16-bit value.
    [[nodiscard]] core::Expected<core::u16> readU16();

    /// @brief Reads an unsigned 32-bit value.
    [[nodiscard]] core::Expected<core::u32> readU32();

    /// @brief Reads a 32-bit float.
    [[nodiscard]] core::Expected<core::f32> readF32();

    /// @brief Reads @p count raw bytes.
    [[nodiscard]] core::Expected<std::vector<core::byte>> readBytes(core::u32 count);

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Returns the total number of written bits.
    [[nodiscard]] core::u32 bitsWritten() const noexcept;

    /// @brief Returns the number of bits remaining for reading.
    [[nodiscard]] core::u32 bitsRemaining() const noexcept;

    /// @brief Returns the underlying byte buffer.
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /// @brief Whether the stream was built from received bytes.
    [[nodiscard]] bool isReadOnly() const noexcept;

    /// @brief Resets read/write cursors to the beginning.
    void reset() noexcept;

private:
    std::vector<core::byte> _buffer;
    core::u32               _writeBit{0};
    core::u32               _readBit{0};
    core::u32               _totalBits{0};
    bool                    _readOnly{false};
};

} // namespace rpl::net::protocol
