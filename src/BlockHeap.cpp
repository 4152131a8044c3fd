#include <BlockHeap.h>

#include <stdlib.h>
#include <stdio.h>
#include <string.h>

// ======================================================================

// CPP defines that control the code compilation for these features,
// this should be kept private in this one translation unit
#define USE_ASSERT                       1
#define USE_REPORT_OPERATION             1
#define USE_VERIFY_TABLE                 1

#if USE_ASSERT

	#define HEAP_ASSERT(a) \
		do \
		{ \
			const bool result = static_cast<bool>(a); \
			if (!result) \
			{ \
				ErrorInfo info; \
				info.type = ErrorInfo::Type::Assert; \
				info.assert = #a; \
				info.file = __FILE__; \
				info.line = __LINE__; \
				external.error(info); \
			} \
		} while (false)

	#define CHECK_TABLE(a, slot) \
		do \
		{ \
			const bool result = static_cast<bool>(a); \
			if (!result) \
			{ \
				ErrorInfo info; \
				info.type = ErrorInfo::Type::TableCorruption; \
				info.assert = #a; \
				info.file = __FILE__; \
				info.line = __LINE__; \
				info.index = (slot); \
				info.count = table.getCount(); \
				info.capacity = table.getCapacity(); \
				if ((slot) >= 0 && (slot) < table.getCount()) \
				{ \
					info.address = table[(slot)].address; \
					info.size = table[(slot)].size; \
				} \
				external.error(info); \
				return; \
			} \
		} while (false)

#else

	#define HEAP_ASSERT(a) static_cast<void>(0)
	#define CHECK_TABLE(a, slot) static_cast<void>(0)

#endif

#if USE_REPORT_OPERATION
	#define REPORT_OPERATION(...) external.report_operation(__VA_ARGS__)
#else
	#define REPORT_OPERATION(...) static_cast<void>(0)
#endif

#define BLOCKHEAP_DEFINE_FLAGS1(flags_name, flags0) \
	const BlockHeap::Flags BlockHeap::flags_name{BlockHeap::Flags::flags0}

const BlockHeap::Flags BlockHeap::zero{0};

BLOCKHEAP_DEFINE_FLAGS1(report_allocation, flag_report_allocation);
BLOCKHEAP_DEFINE_FLAGS1(report_free, flag_report_free);
BLOCKHEAP_DEFINE_FLAGS1(report_compaction, flag_report_compaction);
BLOCKHEAP_DEFINE_FLAGS1(report_rejected, flag_report_rejected);

BLOCKHEAP_DEFINE_FLAGS1(validate_table, flag_validate_table);
BLOCKHEAP_DEFINE_FLAGS1(dump_compaction, flag_dump_compaction);

BLOCKHEAP_DEFINE_FLAGS1(lazy_carving, flag_lazy_carving);
BLOCKHEAP_DEFINE_FLAGS1(halt_on_metadata_exhaustion, flag_halt_on_metadata_exhaustion);

const BlockHeap::Flags BlockHeap::heap_fast = zero;
const BlockHeap::Flags BlockHeap::heap_debug{Flags::flag_validate_table | Flags::flag_report_compaction | Flags::flag_report_rejected};
const BlockHeap::Flags BlockHeap::heap_kernel{Flags::flag_halt_on_metadata_exhaustion};

// ======================================================================

namespace
{
	constexpr static uint64_t TableAlignment = 16;

	// Padding is stored in 32 bits
	constexpr static uint64_t MaximumAlignment = uint64_t(1) << 31;

	// Alignment needs to be a power of 2
	static_assert((TableAlignment & (TableAlignment-1)) == 0);
	static_assert(TableAlignment % alignof(Block) == 0);

	bool IsPowerOfTwo(uint64_t const value)
	{
		return value != 0 && (value & (value - 1)) == 0;
	}

	uint64_t Padding(uint64_t const address, uint64_t const alignment)
	{
		if (alignment <= 1)
			return 0;
		uint64_t const mask = alignment - 1;
		return (alignment - (address & mask)) & mask;
	}

	int FormatRow(char * const buffer, int const buffer_size, Block const & block)
	{
		return snprintf(buffer, static_cast<size_t>(buffer_size), "0x%llx,%llu,%s\n",
			static_cast<unsigned long long>(block.address),
			static_cast<unsigned long long>(block.size),
			block.is_free ? "true" : "false");
	}

	constexpr char const * DumpHeader = "address,size,free\n";
}

// ======================================================================

class BlockHeap::ScopedLock
{
public:

	explicit ScopedLock(ExternalInterface & external_interface)
	:
		external(external_interface)
	{
		external.lock();
	}

	~ScopedLock()
	{
		external.unlock();
	}

private:

	ExternalInterface & external;

	ScopedLock(const ScopedLock &) = delete;
	ScopedLock& operator=(const ScopedLock &) = delete;
};

// ======================================================================

void * BlockHeap::DefaultInterface::table_storage(BlockAddress const address, int64_t const size)
{
	// The heap is identity mapped
	static_cast<void>(size);
	return reinterpret_cast<void *>(static_cast<uintptr_t>(address));
}

void BlockHeap::DefaultInterface::lock()
{
	while (table_lock.test_and_set(std::memory_order_acquire))
		;
}

void BlockHeap::DefaultInterface::unlock()
{
	table_lock.clear(std::memory_order_release);
}

void BlockHeap::DefaultInterface::report_operation(BlockAddress const address, uint64_t const size, uint64_t const alignment, Flags const flags)
{
	if (flags.isAllocate())
	{
		printf("op=alloc result=0x%llx size=%llu align=%llu\n", static_cast<unsigned long long>(address), static_cast<unsigned long long>(size), static_cast<unsigned long long>(alignment));
	}
	else if (flags.isRejected())
	{
		printf("op=free memory=0x%llx ignored\n", static_cast<unsigned long long>(address));
	}
	else
	{
		printf("op=free memory=0x%llx size=%llu\n", static_cast<unsigned long long>(address), static_cast<unsigned long long>(size));
	}
}

void BlockHeap::DefaultInterface::report_compaction(int const merged, int const reclaimed)
{
	printf("op=compact merged=%d reclaimed=%d\n", merged, reclaimed);
}

void BlockHeap::DefaultInterface::report_allocations(BlockAddress const address, uint64_t const size)
{
	printf("allocation memory=0x%llx size=%llu\n", static_cast<unsigned long long>(address), static_cast<unsigned long long>(size));
}

void BlockHeap::DefaultInterface::debug_output(char const * const text, int const length)
{
	fwrite(text, 1, static_cast<size_t>(length), stdout);
}

void BlockHeap::DefaultInterface::error(ErrorInfo const & error)
{
	printf("ERROR!\n");
	switch (error.type)
	{
		case ErrorInfo::Type::Assert:
			printf("  %s:%d\n", error.file, error.line);
			printf("  assert failed: %s\n", error.assert);
			break;

		case ErrorInfo::Type::TableCorruption:
			printf("  %s:%d\n", error.file, error.line);
			printf("  block table corruption at slot %d of %d/%d: %s\n", error.index, error.count, error.capacity, error.assert);
			printf("  block 0x%llx %llu\n", static_cast<unsigned long long>(error.address), static_cast<unsigned long long>(error.size));
			break;

		case ErrorInfo::Type::MetadataExhausted:
			printf("  block table exhausted, %d/%d slots, allocating %llu bytes\n", error.count, error.capacity, static_cast<unsigned long long>(error.size));
			break;

		default:
			printf("  unknown error %d\n", static_cast<int>(error.type));
			break;
	};

	terminate();
}

void BlockHeap::DefaultInterface::terminate()
{
	abort();
}

// ======================================================================

BlockHeap::BlockHeap(ExternalInterface & external_interface, Flags const flags)
:
	external(external_interface),
	heap_flags(flags)
{
	static_assert(sizeof(Block) % alignof(Block) == 0);
}

BlockHeap::~BlockHeap()
{
}

BlockHeap::Status BlockHeap::initialize(BlockAddress const heap_start, BlockAddress const heap_end, int const capacity)
{
	ScopedLock lock(external);

	if (initialized)
		return Status::InvalidRequest;
	if (capacity < 2 || heap_end <= heap_start || (heap_start % TableAlignment) != 0)
		return Status::InvalidRequest;

	// The table is the first thing in the heap and is described by block 0
	uint64_t table_size = static_cast<uint64_t>(capacity) * sizeof(Block);
	table_size += Padding(table_size, TableAlignment);
	if (heap_end - heap_start <= table_size)
		return Status::HeapTooSmall;

	void * const storage = external.table_storage(heap_start, static_cast<int64_t>(table_size));
	if (!storage)
		return Status::InvalidRequest;

	table.attach(storage, capacity);
	if (!table.insert(0, Block(heap_start, table_size, false)))
		return Status::InvalidRequest;

	BlockAddress const table_end = heap_start + table_size;
	if (heap_flags.lazyCarving())
	{
		// Everything past the table is carved on demand
		table.setBounds(heap_start, heap_end, table_end);
	}
	else
	{
		if (!table.insert(1, Block(table_end, heap_end - table_end, true)))
			return Status::InvalidRequest;
		table.setBounds(heap_start, heap_end, heap_end);
	}

	initialized = true;

#if USE_VERIFY_TABLE
	if (heap_flags.validateTable())
		verifyLocked();
#endif

	return Status::Ok;
}

BlockHeap::Allocation BlockHeap::allocate(uint64_t const size, uint64_t const alignment)
{
	ScopedLock lock(external);

	Allocation allocation;
	allocation.status = allocateLocked(size, alignment, allocation.address);

#if USE_VERIFY_TABLE
	if (heap_flags.validateTable())
		verifyLocked();
#endif

	return allocation;
}

BlockHeap::Status BlockHeap::allocateLocked(uint64_t const size, uint64_t const alignment, BlockAddress & result)
{
	if (!initialized)
		return Status::NotInitialized;
	if (size == 0 || (alignment > 1 && !IsPowerOfTwo(alignment)) || alignment > MaximumAlignment)
		return Status::InvalidRequest;

	// The compaction and the retry happen under the one lock acquisition
	for (int attempt = 0; attempt < 2; ++attempt)
	{
		Status status = allocateFromTable(size, alignment, result);
		if (status == Status::OutOfMemory)
			status = allocateFromUnmapped(size, alignment, result);
		if (status != Status::MetadataExhausted)
			return status;

		// Only retry if compacting actually freed up a slot
		if (attempt == 0 && compactLocked() == 0)
			break;
	}

	if (heap_flags.haltOnMetadataExhaustion())
	{
		// Nothing can report the failure this early, so it is fatal
		ErrorInfo info;
		info.type = ErrorInfo::Type::MetadataExhausted;
		info.size = size;
		info.count = table.getCount();
		info.capacity = table.getCapacity();
		external.error(info);
	}

	return Status::MetadataExhausted;
}

void BlockHeap::absorbFollowingFree(int const index)
{
	Block & block = table[index];
	for (int next = table.nextLive(index); next >= 0 && table[next].is_free; next = table.nextLive(index))
	{
		Block & following = table[next];
		HEAP_ASSERT(block.end() == following.address);
		block.merge(following);
		following.needs_delete = true;
	}
}

BlockHeap::Status BlockHeap::allocateFromTable(uint64_t const size, uint64_t const alignment, BlockAddress & result)
{
	// First fit in address order, coalescing free runs on the way
	for (int index = 0; index >= 0; index = table.nextLive(index))
	{
		Block & block = table[index];
		if (!block.is_free)
			continue;

		absorbFollowingFree(index);

		uint64_t const padding = Padding(block.address, alignment);
		if (block.size < padding || block.size - padding < size)
			continue;

		// Only split when the remainder is at least as big as the allocation,
		// smaller slivers stay attached to the allocation
		uint64_t const needed = padding + size;
		if (block.size - needed > needed)
		{
			Block remainder;
			bool const split = block.split(needed, remainder);
			HEAP_ASSERT(split);
			if (!table.insertAfter(index, remainder))
			{
				block.size += remainder.size;
				return Status::MetadataExhausted;
			}
		}

		commitAllocation(block, padding, size, alignment, result);
		return Status::Ok;
	}

	return Status::OutOfMemory;
}

BlockHeap::Status BlockHeap::allocateFromUnmapped(uint64_t const size, uint64_t const alignment, BlockAddress & result)
{
	BlockAddress const unmapped_start = table.getUnmappedStart();
	uint64_t const available = table.getHeapEnd() - unmapped_start;

	int const last = table.previousLive(table.getCount());
	Block & last_block = table[last];

	// A free block touching the unmapped boundary is extended instead of adding a slot
	if (last_block.is_free && last_block.end() == unmapped_start)
	{
		// Both terms lie inside the heap so the sum cannot wrap
		uint64_t const reachable = last_block.size + available;
		uint64_t const padding = Padding(last_block.address, alignment);
		if (padding > reachable || reachable - padding < size)
			return Status::OutOfMemory;

		uint64_t const needed = padding + size;
		if (needed < last_block.size)
			return Status::OutOfMemory;

		table.carve(needed - last_block.size);
		last_block.size = needed;
		commitAllocation(last_block, padding, size, alignment, result);
		return Status::Ok;
	}

	uint64_t const padding = Padding(unmapped_start, alignment);
	if (padding > available || available - padding < size)
		return Status::OutOfMemory;

	Block carved(unmapped_start, padding + size, true);
	if (!table.insertAfter(last, carved))
		return Status::MetadataExhausted;

	table.carve(carved.size);
	commitAllocation(table[table.nextLive(last)], padding, size, alignment, result);
	return Status::Ok;
}

void BlockHeap::commitAllocation(Block & block, uint64_t const padding, uint64_t const size, uint64_t const alignment, BlockAddress & result)
{
	block.is_free = false;
	block.padding = static_cast<uint32_t>(padding);
	result = block.userAddress();

	// Update metrics
	++total_number_of_allocations;
	++current_number_of_allocations;
	current_bytes_allocated += block.size;
	table.adjustAllocationBalance(1);

	if (heap_flags.isAllocate())
		REPORT_OPERATION(result, size, alignment, report_allocation);
}

void BlockHeap::deallocate(BlockAddress const address)
{
	ScopedLock lock(external);

	if (!initialized)
		return;

	// Foreign, interior, table and already free addresses are all quietly ignored
	int const index = (address >= table.getHeapStart() && address < table.getUnmappedStart()) ? table.find(address) : -1;
	if (index <= 0 || table[index].is_free || table[index].userAddress() != address)
	{
		if (heap_flags.isRejected())
			REPORT_OPERATION(address, 0, 0, report_rejected);
		return;
	}

	Block & block = table[index];
	uint64_t const block_size = block.size;
	uint64_t const allocation_size = block_size - block.padding;
	block.is_free = true;
	block.padding = 0;

	// Update metrics
	++total_number_of_frees;
	--current_number_of_allocations;
	current_bytes_allocated -= block_size;
	table.adjustAllocationBalance(-1);

	if (heap_flags.isFree())
		REPORT_OPERATION(address, allocation_size, 0, report_free);

	// Coalesce with the next block if it is free
	int const next = table.nextLive(index);
	if (next >= 0 && table[next].is_free)
	{
		block.merge(table[next]);
		table[next].needs_delete = true;
	}

	// Coalesce with the previous block if it was free
	int const previous = table.previousLive(index);
	if (previous >= 0 && table[previous].is_free)
	{
		table[previous].merge(block);
		block.needs_delete = true;
	}

#if USE_VERIFY_TABLE
	if (heap_flags.validateTable())
		verifyLocked();
#endif
}

// ======================================================================

int BlockHeap::compact()
{
	ScopedLock lock(external);

	if (!initialized)
		return 0;

	int const reclaimed = compactLocked();

#if USE_VERIFY_TABLE
	if (heap_flags.validateTable())
		verifyLocked();
#endif

	return reclaimed;
}

int BlockHeap::mergePass()
{
	int merged = 0;
	int last_free = -1;
	for (int index = 0; index >= 0; index = table.nextLive(index))
	{
		Block & block = table[index];
		if (!block.is_free)
		{
			last_free = -1;
			continue;
		}

		if (last_free >= 0 && table[last_free].isAdjacent(block))
		{
			table[last_free].merge(block);
			block.needs_delete = true;
			++merged;
			continue;
		}

		last_free = index;
	}

	return merged;
}

int BlockHeap::compactLocked()
{
	if (heap_flags.dumpCompaction())
		sendDebugDumpLocked("PRE-GC");

	// Merge until a pass finds nothing, then repack. Used blocks never move.
	int merged = 0;
	for (int pass = mergePass(); pass > 0; pass = mergePass())
		merged += pass;

	int const reclaimed = table.removeTombstones();
	++number_of_compactions;

	if (heap_flags.isCompaction())
		external.report_compaction(merged, reclaimed);

	if (heap_flags.dumpCompaction())
		sendDebugDumpLocked("POST-GC");

	return reclaimed;
}

// ======================================================================

int BlockHeap::findLocked(BlockAddress const address) const
{
	if (!initialized)
		return -1;
	return table.find(address);
}

bool BlockHeap::findBlock(BlockAddress const address, Block & block) const
{
	ScopedLock lock(external);

	int const index = findLocked(address);
	if (index < 0)
		return false;

	block = table[index];
	return true;
}

bool BlockHeap::isAllocated(BlockAddress const address) const
{
	ScopedLock lock(external);

	// Slot 0 is the table itself
	int const index = findLocked(address);
	return index > 0 && !table[index].is_free;
}

uint64_t BlockHeap::getAllocationSize(BlockAddress const address) const
{
	ScopedLock lock(external);

	int const index = findLocked(address);
	if (index <= 0)
		return 0;

	Block const & block = table[index];
	if (block.is_free || block.userAddress() != address)
		return 0;

	return block.size - block.padding;
}

int64_t BlockHeap::getCurrentNumberOfBytesFree() const
{
	ScopedLock lock(external);

	if (!initialized)
		return 0;

	// Virgin memory counts as free
	return static_cast<int64_t>(table.getHeapEnd() - table.getHeapStart() - table[0].size) - current_bytes_allocated;
}

// ======================================================================

int BlockHeap::debugDump(char * const buffer, int const buffer_size) const
{
	ScopedLock lock(external);
	return debugDumpLocked(buffer, buffer_size);
}

int BlockHeap::debugDumpLocked(char * const buffer, int const buffer_size) const
{
	if (buffer && buffer_size > 0)
		buffer[0] = '\0';

	int total = snprintf(buffer, buffer && buffer_size > 0 ? static_cast<size_t>(buffer_size) : 0, "%s", DumpHeader);
	for (int index = 0; index >= 0 && index < table.getCount(); index = table.nextLive(index))
	{
		// Once the buffer is full, keep measuring
		int const remaining = (buffer && total < buffer_size) ? buffer_size - total : 0;
		total += FormatRow(remaining ? buffer + total : nullptr, remaining, table[index]);
	}

	return total;
}

void BlockHeap::sendDebugDump(char const * const label) const
{
	ScopedLock lock(external);
	sendDebugDumpLocked(label);
}

void BlockHeap::sendDebugDumpLocked(char const * const label) const
{
	char line[96];
	int const line_limit = static_cast<int>(sizeof(line)) - 1;

	int length = snprintf(line, sizeof(line), "START-%s\n", label);
	external.debug_output(line, length < line_limit ? length : line_limit);
	external.debug_output(DumpHeader, static_cast<int>(strlen(DumpHeader)));

	for (int index = 0; index >= 0 && index < table.getCount(); index = table.nextLive(index))
	{
		length = FormatRow(line, sizeof(line), table[index]);
		external.debug_output(line, length < line_limit ? length : line_limit);
	}

	length = snprintf(line, sizeof(line), "END-%s\n", label);
	external.debug_output(line, length < line_limit ? length : line_limit);
}

// ======================================================================

void BlockHeap::verify() const
{
	ScopedLock lock(external);
	verifyLocked();
}

void BlockHeap::verifyLocked() const
{
#if USE_ASSERT
	if (!initialized)
		return;

	BlockAddress const heap_start = table.getHeapStart();
	BlockAddress const heap_end = table.getHeapEnd();
	BlockAddress const unmapped_start = table.getUnmappedStart();

	CHECK_TABLE(table.getCount() >= 1 && table.getCount() <= table.getCapacity(), -1);
	CHECK_TABLE(unmapped_start <= heap_end, -1);

	// Block 0 is the table itself
	CHECK_TABLE(!table[0].needs_delete, 0);
	CHECK_TABLE(!table[0].is_free, 0);
	CHECK_TABLE(table[0].address == heap_start, 0);

	// Linearly scan the live blocks, they must tile [heap_start, unmapped_start)
	int used_blocks = 0;
	int64_t used_bytes = 0;
	bool previous_free = false;
	BlockAddress expected = heap_start;
	for (int index = 0; index >= 0; index = table.nextLive(index))
	{
		Block const & block = table[index];
		CHECK_TABLE(block.size > 0, index);
		CHECK_TABLE(block.address == expected, index);
		CHECK_TABLE(block.end() <= unmapped_start, index);
		CHECK_TABLE(block.padding < block.size, index);
		CHECK_TABLE(!(block.is_free && block.padding != 0), index);
		CHECK_TABLE(!(block.is_free && previous_free), index);

		if (!block.is_free && index != 0)
		{
			++used_blocks;
			used_bytes += static_cast<int64_t>(block.size);
		}

		previous_free = block.is_free;
		expected = block.end();
	}

	CHECK_TABLE(expected == unmapped_start, -1);
	CHECK_TABLE(used_blocks == current_number_of_allocations, -1);
	CHECK_TABLE(used_bytes == current_bytes_allocated, -1);
#endif
}

void BlockHeap::reportAllocations() const
{
	ScopedLock lock(external);

	if (!initialized)
		return;

	// Skip block 0, the table is never leaked
	for (int index = table.nextLive(0); index >= 0; index = table.nextLive(index))
	{
		Block const & block = table[index];
		if (!block.is_free)
			external.report_allocations(block.userAddress(), block.size - block.padding);
	}
}
