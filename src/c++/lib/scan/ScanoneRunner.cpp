//
// QtlMap - QTL Mapping for Experimental Crosses
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

#include "scan/ScanoneRunner.hh"

#include "blt_util/log.hh"
#include "common/Exceptions.hh"
#include "hmm/GenotypeProbabilityCalculator.hh"
#include "map/GeneticMapFunction.hh"
#include "map/PseudomarkerUtil.hh"

#ifdef _OPENMP
#include <omp.h>
#endif

#include <cmath>

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>



using namespace qtlmap::common;



std::vector<ReportedPeak>
ScanoneResult::
getPeaksAboveThreshold(const double lodThreshold) const
{
    std::vector<ReportedPeak> reported;
    for (const ChromosomeScanResult& chromResult : chromosomes)
    {
        for (unsigned phenotypeIndex(0); phenotypeIndex<chromResult.peaks.size(); ++phenotypeIndex)
        {
            const ScanonePeak& peak(chromResult.peaks[phenotypeIndex]);
            if (! peak.isDefined()) continue;
            if (peak.lod <= lodThreshold) continue;

            ReportedPeak reportedPeak;
            reportedPeak.chromosome = chromResult.chromosome;
            reportedPeak.phenotypeIndex = phenotypeIndex;
            reportedPeak.peak = peak;
            reported.push_back(reportedPeak);
        }
    }
    return reported;
}



ChromosomeScanResult
scanChromosome(
    const CrossModel& crossModel,
    const ChromosomeMarkers& chromosomeMarkers,
    const GenotypeMatrix& genotypes,
    const PhenotypeMatrix& phenotypes,
    const std::vector<double>& rss0,
    const ScanOptions& options)
{
    static const CovariateMatrix noCovariates;
    static const std::vector<double> noWeights;

    ChromosomeScanResult result;
    result.chromosome = chromosomeMarkers.chromosome;
    result.positions = chromosomeMarkers.markers;

    const std::vector<double> recFracs(getRecombinationFractions(result.positions, options.mapFunction));

    // the probability tensor only lives for the duration of this chromosome's scan:
    Eigen::MatrixXd rss;
    {
        const GenotypeProbabilityTensor genotypeProbs(
            calcGenotypeProbabilities(crossModel, genotypes, result.positions, recFracs, options.errorProb));
        rss = scanoneHK(genotypeProbs, phenotypes, noCovariates, noCovariates, noWeights);
    }

    const unsigned positionCount(rss.rows());
    for (unsigned positionIndex(0); positionIndex<positionCount; ++positionIndex)
    {
        if ((rss.cols() > 0) && std::isnan(rss(positionIndex, 0))) result.degeneratePositionCount++;
    }

    result.lod = rssToLod(rss, rss0, phenotypes.getIndividualCount());
    result.peaks = getPeaks(result.lod, result.positions);
    return result;
}



ScanoneResult
runScanone(
    const CrossData& crossData,
    const ScanOptions& options)
{
    ScanoneResult result;
    result.phenotypeNames = crossData.phenotypes.getColumnNames();

    if (crossData.genotypes.getIndividualCount() != crossData.phenotypes.getIndividualCount())
    {
        std::ostringstream oss;
        oss << "Genotype matrix has " << crossData.genotypes.getIndividualCount()
            << " individuals, phenotype matrix has " << crossData.phenotypes.getIndividualCount();
        BOOST_THROW_EXCEPTION(DimensionMismatchException(oss.str()));
    }

    const std::vector<bool> toOmit(getIndividualsMissingAnyPhenotype(crossData.phenotypes));
    result.omittedIndividualCount = std::count(toOmit.begin(), toOmit.end(), true);
    log_os << "INFO: Omitting " << result.omittedIndividualCount << " individuals with missing phenotype\n";

    const PhenotypeMatrix phenotypes(omitIndividuals(crossData.phenotypes, toOmit));
    const GenotypeMatrix genotypes(omitIndividuals(crossData.genotypes, toOmit));
    result.individualCount = phenotypes.getIndividualCount();

    const MarkerMap scanMarkers(addPseudomarkers(getMarkersByChromosome(crossData.markers), options.stepSize,
                                                 options.pseudomarkerPolicy));

    const CrossModel crossModel(options.crossType);
    const std::vector<double> rss0(scanoneHKNull(phenotypes, CovariateMatrix(), std::vector<double>()));

    const int chromCount(scanMarkers.size());
    result.chromosomes.resize(chromCount);
    std::vector<std::exception_ptr> chromErrors(chromCount);

    for (int chromIndex(0); chromIndex<chromCount; ++chromIndex)
    {
        if (! scanMarkers[chromIndex].chromosome->isSex()) continue;
        ChromosomeScanResult& chromResult(result.chromosomes[chromIndex]);
        chromResult.chromosome = scanMarkers[chromIndex].chromosome;
        chromResult.isSkipped = true;
        log_os << "WARNING: Skipping sex chromosome '" << chromResult.chromosome->getName() << "'\n";
    }

    // every chromosome is an independent unit of work, results are stored at the chromosome index
#pragma omp parallel for schedule(dynamic,1) num_threads(std::max(1u, options.threadCount))
    for (int chromIndex = 0; chromIndex<chromCount; ++chromIndex)
    {
        const ChromosomeMarkers& chromMarkers(scanMarkers[chromIndex]);
        if (chromMarkers.chromosome->isSex()) continue;
        try
        {
            result.chromosomes[chromIndex] = scanChromosome(crossModel, chromMarkers, genotypes, phenotypes, rss0,
                                                            options);
        }
        catch (boost::exception& e)
        {
            e << errinfo_chromosome(chromMarkers.chromosome->getName());
            chromErrors[chromIndex] = std::current_exception();
        }
        catch (...)
        {
            chromErrors[chromIndex] = std::current_exception();
        }
    }

    for (const std::exception_ptr& chromError : chromErrors)
    {
        if (chromError) std::rethrow_exception(chromError);
    }

    for (const ChromosomeScanResult& chromResult : result.chromosomes)
    {
        if (chromResult.isSkipped) continue;
        const std::string& chromName(chromResult.chromosome->getName());
        log_os << "INFO: Chr " << chromName << " : " << chromResult.positions.size() << " scan positions\n";
        if (chromResult.degeneratePositionCount > 0)
        {
            log_os << "WARNING: Chr " << chromName << " : " << chromResult.degeneratePositionCount
                   << " positions with degenerate design, LOD set to NA\n";
        }
    }

    const std::vector<ReportedPeak> peaks(result.getPeaksAboveThreshold(options.lodThreshold));
    log_os << "INFO: Peaks with LOD > " << options.lodThreshold << ":\n";
    for (const ReportedPeak& reported : peaks)
    {
        log_os << "INFO: Chr " << reported.chromosome->getName()
               << " : peak for phenotype " << result.phenotypeNames[reported.phenotypeIndex]
               << ": max lod = " << std::fixed << std::setprecision(2) << reported.peak.lod
               << " at pos = " << reported.peak.position << "\n";
        log_os.unsetf(std::ios_base::floatfield);
        log_os << std::setprecision(6);
    }

    return result;
}
