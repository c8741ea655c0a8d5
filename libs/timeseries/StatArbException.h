// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_EXCEPTION_H
#define __STATARB_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace statarb
{
  // Root of every error raised by the pair-trading pipeline
  class StatArbException : public std::runtime_error
  {
  public:
    explicit StatArbException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~StatArbException() = default;
  };

  // Malformed FX ticker, unsupported interval, missing FX mapping, bad
  // configuration file values
  class ConfigurationException : public StatArbException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : StatArbException(msg)
    {}
  };

  // Too few aligned observations for a regression or a unit-root test
  class DataInsufficiencyException : public StatArbException
  {
  public:
    explicit DataInsufficiencyException(const std::string& msg)
      : StatArbException(msg)
    {}
  };

  // FX pair cannot reconcile the requested currency conversion
  class CurrencyIncompatibilityException : public StatArbException
  {
  public:
    explicit CurrencyIncompatibilityException(const std::string& msg)
      : StatArbException(msg)
    {}
  };

  class DuplicateTimestampException : public StatArbException
  {
  public:
    explicit DuplicateTimestampException(const std::string& msg)
      : StatArbException(msg)
    {}
  };

  //
  // Errors raised by a PriceSource. The core propagates them untouched.
  //
  class PriceSourceException : public StatArbException
  {
  public:
    explicit PriceSourceException(const std::string& msg)
      : StatArbException(msg)
    {}
  };

  class PriceDataNotFoundException : public PriceSourceException
  {
  public:
    explicit PriceDataNotFoundException(const std::string& msg)
      : PriceSourceException(msg)
    {}
  };

  class PriceRangeException : public PriceSourceException
  {
  public:
    explicit PriceRangeException(const std::string& msg)
      : PriceSourceException(msg)
    {}
  };

  class PriceSourceIOException : public PriceSourceException
  {
  public:
    explicit PriceSourceIOException(const std::string& msg)
      : PriceSourceException(msg)
    {}
  };

} // namespace statarb

#endif // __STATARB_EXCEPTION_H
