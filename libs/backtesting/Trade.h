// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STATARB_TRADE_H
#define __STATARB_TRADE_H 1

#include <cstddef>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace statarb
{
  using boost::posix_time::ptime;

  // LONG buys the spread (long A, short ratio * B); SHORT sells it
  enum class TradeSide {Long, Short};

  inline std::string toString(TradeSide side)
  {
    return (side == TradeSide::Long) ? "long" : "short";
  }

  //
  // class Trade
  //
  // A completed round trip on the spread, created when the position is
  // closed.
  //
  class Trade
  {
  public:
    Trade(const ptime& entryDateTime,
	  const ptime& exitDateTime,
	  TradeSide side,
	  double entrySpread,
	  double exitSpread,
	  double pnl,
	  double fee,
	  std::size_t entryBar,
	  std::size_t exitBar)
      : mEntryDateTime(entryDateTime),
	mExitDateTime(exitDateTime),
	mSide(side),
	mEntrySpread(entrySpread),
	mExitSpread(exitSpread),
	mPnl(pnl),
	mFee(fee),
	mEntryBar(entryBar),
	mExitBar(exitBar)
    {}

    const ptime& getEntryDateTime() const
    {
      return mEntryDateTime;
    }

    const ptime& getExitDateTime() const
    {
      return mExitDateTime;
    }

    TradeSide getSide() const
    {
      return mSide;
    }

    bool isLong() const
    {
      return mSide == TradeSide::Long;
    }

    double getEntrySpread() const
    {
      return mEntrySpread;
    }

    double getExitSpread() const
    {
      return mExitSpread;
    }

    // Net of the fee
    double getPnl() const
    {
      return mPnl;
    }

    double getFee() const
    {
      return mFee;
    }

    std::size_t getEntryBar() const
    {
      return mEntryBar;
    }

    std::size_t getExitBar() const
    {
      return mExitBar;
    }

    std::size_t getNumBarsHeld() const
    {
      return mExitBar - mEntryBar;
    }

  private:
    ptime mEntryDateTime;
    ptime mExitDateTime;
    TradeSide mSide;
    double mEntrySpread;
    double mExitSpread;
    double mPnl;
    double mFee;
    std::size_t mEntryBar;
    std::size_t mExitBar;
  };

  inline bool operator==(const Trade& lhs, const Trade& rhs)
  {
    return lhs.getEntryDateTime() == rhs.getEntryDateTime() &&
      lhs.getExitDateTime() == rhs.getExitDateTime() &&
      lhs.getSide() == rhs.getSide() &&
      lhs.getEntrySpread() == rhs.getEntrySpread() &&
      lhs.getExitSpread() == rhs.getExitSpread() &&
      lhs.getPnl() == rhs.getPnl() &&
      lhs.getFee() == rhs.getFee() &&
      lhs.getEntryBar() == rhs.getEntryBar() &&
      lhs.getExitBar() == rhs.getExitBar();
  }

  inline bool operator!=(const Trade& lhs, const Trade& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
