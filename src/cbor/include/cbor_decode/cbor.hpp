#pragma once

#include <cbor_decode/cbor/argument.hpp>
#include <cbor_decode/cbor/detail.hpp>
#include <cbor_decode/cbor/error.hpp>
#include <cbor_decode/cbor/integer.hpp>
#include <cbor_decode/cbor/list.hpp>
#include <cbor_decode/cbor/result.hpp>
#include <cbor_decode/cbor/string.hpp>
#include <cbor_decode/cbor/utf8.hpp>
