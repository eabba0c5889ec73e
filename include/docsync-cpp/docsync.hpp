/// @file docsync.hpp
/// @brief Convenience header that includes the whole public API.

#pragma once

#include <docsync-cpp/client.hpp>
#include <docsync-cpp/credentials.hpp>
#include <docsync-cpp/datastore.hpp>
#include <docsync-cpp/document.hpp>
#include <docsync-cpp/error.hpp>
#include <docsync-cpp/index.hpp>
#include <docsync-cpp/mutation.hpp>
#include <docsync-cpp/query.hpp>
#include <docsync-cpp/settings.hpp>
#include <docsync-cpp/snapshot.hpp>
#include <docsync-cpp/types.hpp>
#include <docsync-cpp/value.hpp>
