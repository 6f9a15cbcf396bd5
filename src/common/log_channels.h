// SPDX-FileCopyrightText: 2019-2024 Connor McLaughlin <stenzek@gmail.com>
// SPDX-License-Identifier: CC-BY-NC-ND-4.0

#pragma once

#define ENUMERATE_LOG_CHANNELS(X)                                                                                      \
  X(ConfigEnricher)                                                                                                    \
  X(Decoder)                                                                                                           \
  X(Document)                                                                                                          \
  X(FileSystem)                                                                                                        \
  X(Log)                                                                                                               \
  X(RangeSpec)                                                                                                         \
  X(SchemaLoader)                                                                                                      \
  X(Settings)
