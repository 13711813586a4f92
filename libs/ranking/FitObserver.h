#pragma once

#include <cstddef>
#include <iomanip>
#include <ostream>
#include "FitResult.h"

namespace plrank::diagnostics
{
  class IterationRecord
  {
  public:
    IterationRecord(unsigned int iteration,
		    double elapsedSeconds,
		    double difference,
		    double previousDifference)
      : m_iteration(iteration),
	m_elapsedSeconds(elapsedSeconds),
	m_difference(difference),
	m_previousDifference(previousDifference)
    {}

    IterationRecord() = delete;

    unsigned int getIteration() const { return m_iteration; }
    double getElapsedSeconds() const { return m_elapsedSeconds; }
    double getDifference() const { return m_difference; }
    double getPreviousDifference() const { return m_previousDifference; }

    // The MM steps should shrink monotonically; growth hints at numerical trouble.
    bool differenceIncreased() const { return m_difference > m_previousDifference; }

  private:
    unsigned int m_iteration;
    double m_elapsedSeconds;
    double m_difference;
    double m_previousDifference;
  };

  class IFitObserver
  {
  public:
    virtual ~IFitObserver() = default;
    virtual void onPreconditionChecked(std::size_t componentCount) = 0;
    virtual void onIteration(const IterationRecord& record) = 0;
    virtual void onFitFinished(FitStatus status, unsigned int iterations) = 0;
  };

  class NullFitObserver : public IFitObserver
  {
  public:
    NullFitObserver() = default;
    ~NullFitObserver() override = default;

    void onPreconditionChecked(std::size_t /*componentCount*/) override {}
    void onIteration(const IterationRecord& /*record*/) override {}
    void onFitFinished(FitStatus /*status*/, unsigned int /*iterations*/) override {}
  };

  /**
   * @brief Verbose-mode diagnostics written to a stream (usually std::cout or a TeeStream).
   *
   * One line per iteration: "<iteration> <seconds> seconds L2=<difference>", plus a
   * warning line whenever the difference grew compared to the previous step.
   */
  class StreamFitObserver : public IFitObserver
  {
  public:
    explicit StreamFitObserver(std::ostream& os)
      : m_os(os)
    {}

    void onPreconditionChecked(std::size_t componentCount) override
    {
      if (componentCount == 1)
	m_os << "No disjoint sets found.  Algorithm convergence conditions are met." << std::endl;
      else
	m_os << componentCount << " disjoint sets found.  Algorithm will diverge." << std::endl;
    }

    void onIteration(const IterationRecord& record) override
    {
      const auto flags = m_os.flags();
      const auto precision = m_os.precision();

      m_os << record.getIteration() << " "
	   << std::fixed << std::setprecision(2) << record.getElapsedSeconds() << " seconds L2="
	   << std::scientific << std::setprecision(2) << record.getDifference() << std::endl;

      if (record.differenceIncreased())
	{
	  m_os << "Gamma difference increased, "
	       << std::scientific << std::setprecision(4) << record.getDifference() << " "
	       << record.getPreviousDifference() << std::endl;
	}

      m_os.flags(flags);
      m_os.precision(precision);
    }

    void onFitFinished(FitStatus status, unsigned int iterations) override
    {
      m_os << "Fit finished: " << fitStatusToString(status)
	   << " after " << iterations << " iterations" << std::endl;
    }

  private:
    std::ostream& m_os;
  };
}
