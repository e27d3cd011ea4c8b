#pragma once

/**
 * biotok
 *
 * Normalizes biomedical documents into index-ready token files. Gene and
 * protein names are split at break points, lowercased, optionally
 * Greek-normalized, recombined and stemmed.
 */

#include <biotok/types.hpp>
#include <biotok/config.hpp>
#include <biotok/pipeline.hpp>
#include <biotok/document_processor.hpp>
