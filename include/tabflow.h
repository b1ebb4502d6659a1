/**
 * @file tabflow.h
 * @brief tabflow - Progressive tabular ingestion pipeline
 * @version 1.0.0
 *
 * This is the main public header for the tabflow library.
 */

#ifndef TABFLOW_H
#define TABFLOW_H

#define TABFLOW_VERSION_MAJOR 1
#define TABFLOW_VERSION_MINOR 0
#define TABFLOW_VERSION_PATCH 0
#define TABFLOW_VERSION_STRING "1.0.0"

// Core headers
#include "tabflow/error.h"
#include "tabflow/options.h"
#include "tabflow/trace.h"
#include "tabflow/types.h"

// Input and CSV parsing
#include "tabflow/byte_source.h"
#include "tabflow/row_reader.h"
#include "tabflow/type_inference.h"

// Storage
#include "tabflow/blob_store.h"
#include "tabflow/blob_uploader.h"
#include "tabflow/catalog.h"

// Wire protocol
#include "tabflow/frame_decoder.h"
#include "tabflow/protocol.h"
#include "tabflow/stream_event.h"
#include "tabflow/wire.h"

// Server side
#include "tabflow/chunk_streamer.h"
#include "tabflow/ingest_service.h"
#include "tabflow/metadata_extractor.h"

// Client side
#include "tabflow/byte_channel.h"
#include "tabflow/cancel_token.h"
#include "tabflow/ingest_pipeline.h"
#include "tabflow/ingest_session.h"
#include "tabflow/progress.h"
#include "tabflow/size_router.h"
#include "tabflow/table_materializer.h"
#include "tabflow/transport.h"

// Table engines
#include "tabflow/sqlite_table_engine.h"
#include "tabflow/table_engine.h"

#endif // TABFLOW_H
