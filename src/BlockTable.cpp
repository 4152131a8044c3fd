#include <BlockTable.h>

#include <new>

// ======================================================================

void BlockTable::attach(void * const storage, int const slot_count)
{
	Block * const first = static_cast<Block *>(storage);
	for (int i = 0; i < slot_count; ++i)
		new(static_cast<void *>(first + i)) Block();

	slots = first;
	capacity = slot_count;
	count = 0;
}

void BlockTable::clear()
{
	for (int i = 0; i < count; ++i)
		slots[i] = Block();
	count = 0;
	allocation_balance = 0;
}

void BlockTable::setBounds(BlockAddress const start, BlockAddress const end, BlockAddress const unmapped)
{
	heap_start = start;
	heap_end = end;
	unmapped_start = unmapped;
}

BlockAddress BlockTable::carve(uint64_t const size)
{
	BlockAddress const start = unmapped_start;
	unmapped_start += size;
	return start;
}

int BlockTable::getLiveCount() const
{
	int live = 0;
	for (int i = 0; i < count; ++i)
		if (!slots[i].needs_delete)
			++live;
	return live;
}

int BlockTable::getTombstoneCount() const
{
	return count - getLiveCount();
}

bool BlockTable::insert(int const index, Block const & block)
{
	if (count >= capacity || index < 0 || index > count)
		return false;

	for (int i = count; i > index; --i)
		slots[i] = slots[i - 1];

	slots[index] = block;
	++count;
	return true;
}

bool BlockTable::insertAfter(int const index, Block const & block)
{
	// A tombstone directly after the block sits inside the old range of the
	// block, so overwriting it keeps the live slots ordered without a shift
	int const next = index + 1;
	if (next < count && slots[next].needs_delete)
	{
		slots[next] = block;
		return true;
	}

	return insert(next, block);
}

int BlockTable::nearestLive(int const index, int const low, int const high) const
{
	for (int i = index; i >= low; --i)
		if (!slots[i].needs_delete)
			return i;

	for (int i = index + 1; i <= high; ++i)
		if (!slots[i].needs_delete)
			return i;

	return -1;
}

int BlockTable::find(BlockAddress const address) const
{
	// binary search over the live slots, tombstones are stepped over
	int low = 0;
	int high = count - 1;
	while (low <= high)
	{
		int const middle = low + (high - low) / 2;
		int const live = nearestLive(middle, low, high);
		if (live < 0)
			return -1;

		Block const & block = slots[live];
		if (address < block.address)
			high = live - 1;
		else if (address >= block.end())
			low = live + 1;
		else
			return live;
	}

	return -1;
}

int BlockTable::nextLive(int const index) const
{
	for (int i = index + 1; i < count; ++i)
		if (!slots[i].needs_delete)
			return i;
	return -1;
}

int BlockTable::previousLive(int const index) const
{
	for (int i = index - 1; i >= 0; --i)
		if (!slots[i].needs_delete)
			return i;
	return -1;
}

int BlockTable::removeTombstones()
{
	int kept = 0;
	for (int i = 0; i < count; ++i)
	{
		if (slots[i].needs_delete)
			continue;
		if (kept != i)
			slots[kept] = slots[i];
		++kept;
	}

	int const reclaimed = count - kept;
	for (int i = kept; i < count; ++i)
		slots[i] = Block();

	count = kept;
	return reclaimed;
}
