/*
 * Umbrella header for the stores library: thread-safe observable values.
 *
 *  Cell     - readable/writable value, notifies on every write
 *  Derived  - read-only value recomputed whenever an upstream emitter notifies
 *  Deduped  - mirror of a readable source that only notifies on actual change
 *  Event    - valueless emitter
 */

#ifndef STORES_H
#define STORES_H

#include <stores/stores_export.h>
#include <stores/types/any_emitter.h>
#include <stores/types/callback.h>
#include <stores/types/callback_registry.h>
#include <stores/types/cell.h>
#include <stores/types/contracts.h>
#include <stores/types/deduped.h>
#include <stores/types/derived.h>
#include <stores/types/event.h>
#include <stores/types/unsubscriber.h>
#include <stores/util/errors.h>
#include <stores/util/trace.h>
#include <stores/format.h>

#endif  // STORES_H
