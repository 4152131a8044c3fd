#pragma once

#include <BlockHeap.h>

#include <stdint.h>

// The kernel's interface to its heap: the table lock also masks interrupts so
// a handler can never observe a half split or half merged table, and fatal
// errors halt instead of aborting.
class HeapInterface : public BlockHeap::DefaultInterface
{
public:
	void lock() override;
	void unlock() override;
	void report_operation(BlockAddress address, uint64_t size, uint64_t alignment, BlockHeap::Flags flags) override;
	void terminate() override;

	bool permissive = false;
	bool report_operations = false;

private:
	uint64_t saved_interrupt_state = 0;
};

// Construct the kernel heap over [heap_start, heap_end) the first time it is
// called, later calls hand back the same heap. There is no allocator to fall
// back on this early, so a failed initialization is fatal.
BlockHeap & CreateGlobalHeap(HeapInterface & heap_interface, BlockAddress heap_start, BlockAddress heap_end, int capacity = BlockHeap::DefaultCapacity, BlockHeap::Flags flags = BlockHeap::heap_kernel);
