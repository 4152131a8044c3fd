#pragma once

#include <Block.h>
#include <BlockTable.h>

#include <atomic>

#include <stddef.h>
#include <stdint.h>

// ======================================================================

#define BLOCKHEAP_DEFINE_FLAG(flag_name, flag_bit, function_name) \
	static inline constexpr uint32_t flag_name  = flag_bit; \
	inline bool function_name() const { return (flag_name & flags) != 0; }

#define BLOCKHEAP_DECLARE_FLAGS(flags_name) \
	static const BlockHeap::Flags flags_name

// ======================================================================

// Block table allocator for a single fixed heap region.
//
// The table describing the heap lives at the start of the heap itself and
// is reached through ExternalInterface::table_storage(). Every other address
// is an opaque integer, so the allocator can run over memory it never maps.
class BlockHeap
{
public:

	static constexpr int DefaultCapacity = 512;

	struct Flags
	{
		BLOCKHEAP_DEFINE_FLAG(flag_report_allocation,         0b0000'0000'0000'0001, isAllocate);
		BLOCKHEAP_DEFINE_FLAG(flag_report_free,               0b0000'0000'0000'0010, isFree);
		BLOCKHEAP_DEFINE_FLAG(flag_report_compaction,         0b0000'0000'0000'0100, isCompaction);
		BLOCKHEAP_DEFINE_FLAG(flag_report_rejected,           0b0000'0000'0000'1000, isRejected);

		BLOCKHEAP_DEFINE_FLAG(flag_validate_table,            0b0000'0000'0001'0000, validateTable);
		BLOCKHEAP_DEFINE_FLAG(flag_dump_compaction,           0b0000'0000'0010'0000, dumpCompaction);

		BLOCKHEAP_DEFINE_FLAG(flag_lazy_carving,              0b0000'0001'0000'0000, lazyCarving);
		BLOCKHEAP_DEFINE_FLAG(flag_halt_on_metadata_exhaustion, 0b0000'0010'0000'0000, haltOnMetadataExhaustion);

		uint32_t flags;
	};

	BLOCKHEAP_DECLARE_FLAGS(zero);

	BLOCKHEAP_DECLARE_FLAGS(heap_fast);
	BLOCKHEAP_DECLARE_FLAGS(heap_debug);
	BLOCKHEAP_DECLARE_FLAGS(heap_kernel);

	BLOCKHEAP_DECLARE_FLAGS(report_allocation);
	BLOCKHEAP_DECLARE_FLAGS(report_free);
	BLOCKHEAP_DECLARE_FLAGS(report_compaction);
	BLOCKHEAP_DECLARE_FLAGS(report_rejected);

	BLOCKHEAP_DECLARE_FLAGS(validate_table);
	BLOCKHEAP_DECLARE_FLAGS(dump_compaction);

	BLOCKHEAP_DECLARE_FLAGS(lazy_carving);
	BLOCKHEAP_DECLARE_FLAGS(halt_on_metadata_exhaustion);

	enum class Status
	{
		Ok,
		OutOfMemory,
		MetadataExhausted,
		InvalidRequest,
		HeapTooSmall,
		NotInitialized
	};

	struct Allocation
	{
		Status status = Status::NotInitialized;
		BlockAddress address = 0;

		bool succeeded() const { return status == Status::Ok; }
	};

	struct ErrorInfo
	{
		enum class Type
		{
			Unknown,
			Assert,
			TableCorruption,
			MetadataExhausted
		};

		Type type = Type::Unknown;
		BlockAddress address = 0;
		uint64_t size = 0;

		char const * assert = nullptr;
		char const * file = nullptr;
		int line = 0;

		// slot of the table the error was found at
		int index = -1;
		int count = 0;
		int capacity = 0;
	};

	struct ExternalInterface
	{
		virtual void * table_storage(BlockAddress address, int64_t size) = 0;
		virtual void lock() = 0;
		virtual void unlock() = 0;
		virtual void report_operation(BlockAddress address, uint64_t size, uint64_t alignment, Flags flags) = 0;
		virtual void report_compaction(int merged, int reclaimed) = 0;
		virtual void report_allocations(BlockAddress address, uint64_t size) = 0;
		virtual void debug_output(char const * text, int length) = 0;
		virtual void error(ErrorInfo const & info) = 0;
		virtual void terminate() = 0;
	};
	struct DefaultInterface : public ExternalInterface
	{
		void * table_storage(BlockAddress address, int64_t size) override;
		void lock() override;
		void unlock() override;
		void report_operation(BlockAddress address, uint64_t size, uint64_t alignment, Flags flags) override;
		void report_compaction(int merged, int reclaimed) override;
		void report_allocations(BlockAddress address, uint64_t size) override;
		void debug_output(char const * text, int length) override;
		void error(ErrorInfo const & info) override;
		void terminate() override;

	protected:
		std::atomic_flag table_lock = ATOMIC_FLAG_INIT;
	};

	BlockHeap(ExternalInterface & external_interface, Flags enabled);
	~BlockHeap();

	// Lay the table out at heap_start and take ownership of [heap_start, heap_end)
	Status initialize(BlockAddress heap_start, BlockAddress heap_end, int capacity = DefaultCapacity);
	bool isInitialized() const;

	// An alignment of 0 or 1 requests no alignment, otherwise it must be a power of 2
	Allocation allocate(uint64_t size, uint64_t alignment = 0);

	// Addresses that were not returned by allocate, or are already free, are ignored
	void deallocate(BlockAddress address);

	// Merge free neighbors and drop tombstones, returns the number of table slots reclaimed
	int compact();

	bool isAllocated(BlockAddress address) const;
	bool findBlock(BlockAddress address, Block & block) const;
	uint64_t getAllocationSize(BlockAddress address) const;

	int64_t allocationBalance() const;
	bool hasLeaks() const;

	int getTotalNumberOfAllocations() const;
	int getTotalNumberOfFrees() const;
	int getCurrentNumberOfAllocations() const;
	int getNumberOfCompactions() const;

	int64_t getCurrentNumberOfBytesAllocated() const;
	int64_t getCurrentNumberOfBytesFree() const;

	int getCapacity() const;
	int getCount() const;
	int getLiveCount() const;
	int getTombstoneCount() const;

	BlockAddress getHeapStart() const;
	BlockAddress getHeapEnd() const;
	BlockAddress getUnmappedStart() const;

	// Render the live table as "address,size,free" rows. Returns the number of
	// bytes the whole snapshot needs, the buffer is always NUL terminated.
	int debugDump(char * buffer, int buffer_size) const;

	// Stream the snapshot through ExternalInterface::debug_output
	void sendDebugDump(char const * label) const;

	// Verify the table invariants, violations are reported as errors
	void verify() const;

	// Print outstanding allocations
	void reportAllocations() const;

	// Unlocked view of the table for diagnostics
	BlockTable const & getTable() const;

private:

	class ScopedLock;

private:

	Status allocateLocked(uint64_t size, uint64_t alignment, BlockAddress & result);
	Status allocateFromTable(uint64_t size, uint64_t alignment, BlockAddress & result);
	Status allocateFromUnmapped(uint64_t size, uint64_t alignment, BlockAddress & result);
	void absorbFollowingFree(int index);
	void commitAllocation(Block & block, uint64_t padding, uint64_t size, uint64_t alignment, BlockAddress & result);
	int findLocked(BlockAddress address) const;

	int compactLocked();
	int mergePass();

	int debugDumpLocked(char * buffer, int buffer_size) const;
	void sendDebugDumpLocked(char const * label) const;
	void verifyLocked() const;

private:

	ExternalInterface & external;
	const Flags heap_flags;
	bool initialized = false;

	BlockTable table;

	int total_number_of_allocations = 0;
	int total_number_of_frees = 0;
	int current_number_of_allocations = 0;
	int number_of_compactions = 0;

	int64_t current_bytes_allocated = 0;

private:

	BlockHeap(const BlockHeap &) = delete;
	BlockHeap& operator=(const BlockHeap &) = delete;
	BlockHeap(BlockHeap &&) = delete;
	BlockHeap& operator=(BlockHeap &&) = delete;
};

// ======================================================================

inline bool BlockHeap::isInitialized() const
{
	return initialized;
}

inline int64_t BlockHeap::allocationBalance() const
{
	return table.getAllocationBalance();
}

inline bool BlockHeap::hasLeaks() const
{
	return allocationBalance() != 0;
}

inline int BlockHeap::getTotalNumberOfAllocations() const
{
	return total_number_of_allocations;
}

inline int BlockHeap::getTotalNumberOfFrees() const
{
	return total_number_of_frees;
}

inline int BlockHeap::getCurrentNumberOfAllocations() const
{
	return current_number_of_allocations;
}

inline int BlockHeap::getNumberOfCompactions() const
{
	return number_of_compactions;
}

inline int64_t BlockHeap::getCurrentNumberOfBytesAllocated() const
{
	return current_bytes_allocated;
}

inline int BlockHeap::getCapacity() const
{
	return table.getCapacity();
}

inline int BlockHeap::getCount() const
{
	return table.getCount();
}

inline int BlockHeap::getLiveCount() const
{
	return table.getLiveCount();
}

inline int BlockHeap::getTombstoneCount() const
{
	return table.getTombstoneCount();
}

inline BlockAddress BlockHeap::getHeapStart() const
{
	return table.getHeapStart();
}

inline BlockAddress BlockHeap::getHeapEnd() const
{
	return table.getHeapEnd();
}

inline BlockAddress BlockHeap::getUnmappedStart() const
{
	return table.getUnmappedStart();
}

inline BlockTable const & BlockHeap::getTable() const
{
	return table;
}

inline BlockHeap::Flags operator|(BlockHeap::Flags const & lhs, BlockHeap::Flags const & rhs)
{
	return BlockHeap::Flags{lhs.flags | rhs.flags};
}

inline BlockHeap::Flags& operator|=(BlockHeap::Flags & lhs, BlockHeap::Flags const & rhs)
{
	lhs.flags |= rhs.flags;
	return lhs;
}

inline BlockHeap::Flags operator&(BlockHeap::Flags const & lhs, BlockHeap::Flags const & rhs)
{
	return BlockHeap::Flags{lhs.flags & rhs.flags};
}

inline bool operator==(BlockHeap::Flags const & lhs, BlockHeap::Flags const & rhs)
{
	return lhs.flags == rhs.flags;
}

inline bool operator!=(BlockHeap::Flags const & lhs, BlockHeap::Flags const & rhs)
{
	return lhs.flags != rhs.flags;
}
