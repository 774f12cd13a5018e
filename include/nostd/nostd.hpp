#pragma once

#include "nostd/config.hpp"
#include "nostd/errors.hpp"
#include "nostd/data/data.hpp"
#include "nostd/data/hex.hpp"
#include "nostd/data/relay_response.hpp"
#include "nostd/data/serializer.hpp"
#include "nostd/cryptography/entropy.hpp"
#include "nostd/cryptography/hash.hpp"
#include "nostd/cryptography/nip04.hpp"
#include "nostd/signer/signer.hpp"
#include "nostd/signer/noscrypt_signer.hpp"
#include "nostd/builder/event_builder.hpp"
#include "nostd/builder/kind_builders.hpp"
