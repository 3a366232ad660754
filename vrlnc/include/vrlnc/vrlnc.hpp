#pragma once

#include "core/types.hpp"
#include "core/bytes.hpp"
#include "core/hash.hpp"
#include "core/random.hpp"

#include "crypto/field25519.hpp"
#include "crypto/scalar.hpp"
#include "crypto/ristretto255.hpp"
#include "crypto/generators.hpp"
#include "crypto/msm.hpp"
#include "crypto/commitment.hpp"

#include "coding/chunk_codec.hpp"
#include "coding/committer.hpp"
#include "coding/echelon.hpp"
#include "coding/packet.hpp"

#include "ops/source_node.hpp"
#include "ops/destination_node.hpp"

#include "utils/log.hpp"
