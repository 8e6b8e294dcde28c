#pragma once
/**
 * @file bp_transfer.hpp
 * @brief Layer 3: the block transfer engine built on bp_service.
 *
 * Provides chunk types, ChunkSequencer, BoundedQueue, WorkerPool, ReorderBuffer,
 * TransferState, ProgressReporter, BlockDevice / FileDevice, byte streams and the
 * read and write pipelines.
 */
#include "bp_service.hpp"

#include "transfer/chunk.hpp"
#include "transfer/chunk_sequencer.hpp"
#include "transfer/bounded_queue.hpp"
#include "transfer/chunk_window.hpp"
#include "transfer/worker_pool.hpp"
#include "transfer/reorder_buffer.hpp"
#include "transfer/transfer_state.hpp"
#include "transfer/progress_reporter.hpp"
#include "transfer/block_device.hpp"
#include "transfer/byte_stream.hpp"
#include "transfer/pipeline.hpp"
