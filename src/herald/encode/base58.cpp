#include <herald/encode/base58.hpp>

#include <algorithm>
#include <array>
#include <cstdint>

#include <herald/crypto/hash.hpp>

namespace herald::encode {

namespace {

constexpr std::string_view alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr std::size_t base            = 58;
constexpr std::size_t byte_base       = 256;
constexpr std::size_t ascii_range     = 128;
constexpr std::int8_t invalid_digit   = -1;

// log(256) / log(58) and log(58) / log(256), rounded up
constexpr std::size_t encode_ratio_num = 138;
constexpr std::size_t encode_ratio_den = 100;
constexpr std::size_t decode_ratio_num = 733;
constexpr std::size_t decode_ratio_den = 1'000;

constexpr std::array< std::int8_t, ascii_range > make_digit_map() noexcept
{
  std::array< std::int8_t, ascii_range > map{};
  map.fill( invalid_digit );
  for( std::size_t i = 0; i < alphabet.size(); ++i )
    map[ static_cast< std::size_t >( alphabet[ i ] ) ] = static_cast< std::int8_t >( i );
  return map;
}

constexpr auto digit_map = make_digit_map();

std::array< std::byte, base58_checksum_length > checksum( std::span< const std::byte > payload )
{
  auto first  = crypto::sha256( payload );
  auto second = crypto::sha256( std::span< const std::byte >( first ) );

  std::array< std::byte, base58_checksum_length > sum{};
  std::copy_n( second.begin(), sum.size(), sum.begin() );
  return sum;
}

} // namespace

std::string to_base58( std::span< const std::byte > s ) noexcept
{
  std::size_t zeroes = 0;
  while( zeroes < s.size() && s[ zeroes ] == std::byte{ 0x00 } )
    ++zeroes;

  const std::size_t size = ( s.size() - zeroes ) * encode_ratio_num / encode_ratio_den + 1;
  std::vector< std::uint8_t > digits( size );
  std::size_t length = 0;

  for( std::size_t i = zeroes; i < s.size(); ++i )
  {
    std::size_t carry = std::to_integer< std::size_t >( s[ i ] );
    std::size_t j     = 0;
    for( auto it = digits.rbegin(); ( carry != 0 || j < length ) && it != digits.rend(); ++it, ++j )
    {
      carry += byte_base * *it;
      *it    = static_cast< std::uint8_t >( carry % base );
      carry /= base;
    }
    length = j;
  }

  auto it = digits.begin() + static_cast< std::ptrdiff_t >( size - length );
  while( it != digits.end() && *it == 0 )
    ++it;

  std::string str;
  str.reserve( zeroes + static_cast< std::size_t >( digits.end() - it ) );
  str.assign( zeroes, alphabet[ 0 ] );
  for( ; it != digits.end(); ++it )
    str += alphabet[ *it ];

  return str;
}

result< std::vector< std::byte > > from_base58( std::string_view sv ) noexcept
{
  std::size_t zeroes = 0;
  while( zeroes < sv.size() && sv[ zeroes ] == alphabet[ 0 ] )
    ++zeroes;

  const std::size_t size = ( sv.size() - zeroes ) * decode_ratio_num / decode_ratio_den + 1;
  std::vector< std::uint8_t > bytes( size );
  std::size_t length = 0;

  for( std::size_t i = zeroes; i < sv.size(); ++i )
  {
    auto c = static_cast< unsigned char >( sv[ i ] );
    if( c >= ascii_range || digit_map[ c ] == invalid_digit )
      return std::unexpected( encode_errc::invalid_character );

    auto carry    = static_cast< std::size_t >( digit_map[ c ] );
    std::size_t j = 0;
    for( auto it = bytes.rbegin(); ( carry != 0 || j < length ) && it != bytes.rend(); ++it, ++j )
    {
      carry += base * *it;
      *it    = static_cast< std::uint8_t >( carry % byte_base );
      carry /= byte_base;
    }
    length = j;
  }

  auto it = bytes.begin() + static_cast< std::ptrdiff_t >( size - length );

  std::vector< std::byte > out;
  out.reserve( zeroes + static_cast< std::size_t >( bytes.end() - it ) );
  out.assign( zeroes, std::byte{ 0x00 } );
  for( ; it != bytes.end(); ++it )
    out.push_back( std::byte{ *it } );

  return out;
}

std::string to_base58_check( std::span< const std::byte > s )
{
  std::vector< std::byte > buffer( s.begin(), s.end() );
  auto sum = checksum( s );
  buffer.insert( buffer.end(), sum.begin(), sum.end() );
  return to_base58( buffer );
}

result< std::vector< std::byte > > from_base58_check( std::string_view sv )
{
  auto decoded = from_base58( sv );
  if( !decoded )
    return std::unexpected( decoded.error() );

  if( decoded->size() < base58_checksum_length )
    return std::unexpected( encode_errc::invalid_length );

  const auto payload_length = decoded->size() - base58_checksum_length;
  std::span< const std::byte > payload( decoded->data(), payload_length );
  std::span< const std::byte > received( decoded->data() + payload_length, base58_checksum_length );

  if( !std::ranges::equal( checksum( payload ), received ) )
    return std::unexpected( encode_errc::invalid_checksum );

  decoded->resize( payload_length );
  return decoded;
}

} // namespace herald::encode
