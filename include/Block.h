#pragma once

#include <stddef.h>
#include <stdint.h>

// ======================================================================

// Heap addresses are opaque to the allocator, it never dereferences them
using BlockAddress = uint64_t;

// ======================================================================

struct Block
{
	/* 8 */ uint64_t size = 0;
	/* 8 */ BlockAddress address = 0;

	// offset from address to the memory handed to the caller
	/* 4 */ uint32_t padding = 0;
	/* 1 */ bool is_free = false;

	// merged into a neighbor, dropped by the next compaction
	/* 1 */ bool needs_delete = false;

	Block() = default;
	Block(BlockAddress block_address, uint64_t block_size, bool free);

	BlockAddress end() const;
	BlockAddress userAddress() const;
	bool contains(BlockAddress value) const;
	bool isAdjacent(Block const & other) const;

	// Shrink this block to `size` bytes, returning the free remainder in `remainder`
	bool split(uint64_t split_size, Block & remainder);

	// Absorb an adjacent block into this one, the lower address is kept
	void merge(Block const & other);
};

// ======================================================================

inline Block::Block(BlockAddress const block_address, uint64_t const block_size, bool const free)
:
	size(block_size),
	address(block_address),
	is_free(free)
{
}

inline BlockAddress Block::end() const
{
	return address + size;
}

inline BlockAddress Block::userAddress() const
{
	return address + padding;
}

inline bool Block::contains(BlockAddress const value) const
{
	return value >= address && value < end();
}

inline bool Block::isAdjacent(Block const & other) const
{
	return end() == other.address || other.end() == address;
}

inline bool Block::split(uint64_t const split_size, Block & remainder)
{
	if (size < split_size)
		return false;

	remainder = Block(address + split_size, size - split_size, true);
	size = split_size;
	return true;
}

inline void Block::merge(Block const & other)
{
	if (other.address < address)
		address = other.address;
	size += other.size;
}

inline bool operator<(Block const & lhs, Block const & rhs)
{
	return lhs.address < rhs.address;
}
