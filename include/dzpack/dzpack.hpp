#pragma once

#include "ZigZag.hpp"
#include "BitWidth.hpp"
#include "FastBitPacker.hpp"
#include "DeltaCodec.hpp"
#include "CompressionProfile.hpp"
#include "DeltaBlockSequence.hpp"
#include "utils.hpp"
