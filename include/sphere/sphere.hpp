#pragma once

// Umbrella header: the SPHERE reader/writer and its helpers

#include "sphere/audio.hpp"
#include "sphere/config.hpp"
#include "sphere/convert.hpp"
#include "sphere/error.hpp"
#include "sphere/header.hpp"
#include "sphere/params.hpp"
#include "sphere/sample.hpp"
#include "sphere/session.hpp"
#include "sphere/stream.hpp"
#include "sphere/wave.hpp"
