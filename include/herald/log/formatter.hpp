#pragma once

#include <span>

#include <quill/BinaryDataDeferredFormatCodec.h>

#include <herald/encode.hpp>

namespace herald::log {

struct base58_tag
{};

using base58 = quill::BinaryData< base58_tag >;

} // namespace herald::log

template<>
struct fmtquill::formatter< herald::log::base58 >
{
  constexpr auto parse( format_parse_context& ctx )
  {
    return ctx.begin();
  }

  auto format( const herald::log::base58& bin_data, format_context& ctx ) const
  {
    return fmtquill::format_to( ctx.out(),
                                "{}",
                                herald::encode::to_base58( std::span( bin_data.data(), bin_data.size() ) ) );
  }
};

template<>
struct quill::Codec< herald::log::base58 >: quill::BinaryDataDeferredFormatCodec< herald::log::base58 >
{};
