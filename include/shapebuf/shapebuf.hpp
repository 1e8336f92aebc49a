//! # shapebuf
//!
//! Umbrella header: the structured-data model, standard library support, the
//! `Buffer` type and its builder.
//!
//! ## Modules
//!
//! | Header | Contents |
//! |--------|----------|
//! | `model/model_ser.hpp` | `Serializer`, `Serialize<T>` |
//! | `model/model_de.hpp` | `Deserializer`, `Visitor`, access interfaces, `Deserialize<T>` |
//! | `model/model_std.hpp` | Implementations for standard library types |
//! | `model/model_error.hpp` | `Error`, `CaptureError`, `ReplayError` |
//! | `buffer/buffer.hpp` | `Buffer` |
//! | `buffer/buffer_builder.hpp` | `BufferBuilder` |
//! | `buffer/buffer_options.hpp` | `CaptureOptions` |
//! | `buffer/buffer_source.hpp` | `SourceRegions`, `SourceExtent<T>` |
//! | `log/log.hpp` | Logging |

#pragma once

#include "shapebuf/buffer/buffer.hpp"
#include "shapebuf/buffer/buffer_builder.hpp"
#include "shapebuf/buffer/buffer_options.hpp"
#include "shapebuf/buffer/buffer_source.hpp"
#include "shapebuf/common.hpp"
#include "shapebuf/log/log.hpp"
#include "shapebuf/model/model_de.hpp"
#include "shapebuf/model/model_error.hpp"
#include "shapebuf/model/model_ser.hpp"
#include "shapebuf/model/model_std.hpp"
