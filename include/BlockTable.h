#pragma once

#include <Block.h>

#include <stddef.h>
#include <stdint.h>

// ======================================================================

// Fixed capacity arena of Block slots ordered by address, plus the bounds
// of the heap the slots describe.
//
// Slots are never removed in place. A slot that has been merged into a
// neighbor is tombstoned (needs_delete) and stays where it is until
// removeTombstones() repacks the array. Only live slots are guaranteed to
// be ordered, a tombstone's address is stale.
class BlockTable
{
public:

	BlockTable() = default;

	// Construct `capacity` empty slots in `storage`
	void attach(void * storage, int capacity);

	int getCount() const;
	int getCapacity() const;
	bool isFull() const;

	int getLiveCount() const;
	int getTombstoneCount() const;

	Block & operator[](int index);
	Block const & operator[](int index) const;

	// Insert a slot at `index`, shifting the later slots up. Fails when the table is full.
	bool insert(int index, Block const & block);

	// Place a block directly after `index`, reusing a tombstone there if there is one
	bool insertAfter(int index, Block const & block);

	// Index of the live slot whose range holds `address`, or -1
	int find(BlockAddress address) const;

	// Neighboring live slots, or -1
	int nextLive(int index) const;
	int previousLive(int index) const;

	// Drop all tombstoned slots and repack, returns the number of slots reclaimed
	int removeTombstones();

	void clear();

	void setBounds(BlockAddress start, BlockAddress end, BlockAddress unmapped);
	BlockAddress getHeapStart() const;
	BlockAddress getHeapEnd() const;
	BlockAddress getUnmappedStart() const;

	// Carve `size` bytes of virgin memory, returns the start of the carved range
	BlockAddress carve(uint64_t size);

	int64_t getAllocationBalance() const;
	void adjustAllocationBalance(int64_t delta);

private:

	int nearestLive(int index, int low, int high) const;

private:

	Block * slots = nullptr;
	int capacity = 0;
	int count = 0;

	BlockAddress heap_start = 0;
	BlockAddress heap_end = 0;
	BlockAddress unmapped_start = 0;

	int64_t allocation_balance = 0;

private:

	BlockTable(const BlockTable &) = delete;
	BlockTable& operator=(const BlockTable &) = delete;
};

// ======================================================================

inline int BlockTable::getCount() const
{
	return count;
}

inline int BlockTable::getCapacity() const
{
	return capacity;
}

inline bool BlockTable::isFull() const
{
	return count >= capacity;
}

inline Block & BlockTable::operator[](int const index)
{
	return slots[index];
}

inline Block const & BlockTable::operator[](int const index) const
{
	return slots[index];
}

inline BlockAddress BlockTable::getHeapStart() const
{
	return heap_start;
}

inline BlockAddress BlockTable::getHeapEnd() const
{
	return heap_end;
}

inline BlockAddress BlockTable::getUnmappedStart() const
{
	return unmapped_start;
}

inline int64_t BlockTable::getAllocationBalance() const
{
	return allocation_balance;
}

inline void BlockTable::adjustAllocationBalance(int64_t const delta)
{
	allocation_balance += delta;
}
