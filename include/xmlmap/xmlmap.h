#pragma once

/**
 * @file xmlmap.h
 * @brief Everything needed to declare processors and decode / encode documents.
 */

#include <xmlmap/util/errors.h>
#include <xmlmap/types/value.h>
#include <xmlmap/types/record.h>
#include <xmlmap/types/processor.h>
#include <xmlmap/document/xml_document.h>
#include <xmlmap/runtime/observers/processing_trace.h>
#include <xmlmap/serialization.h>
