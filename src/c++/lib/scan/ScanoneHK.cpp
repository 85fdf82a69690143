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

#include "scan/ScanoneHK.hh"

#include "common/Exceptions.hh"

#include <cmath>

#include <sstream>



using namespace qtlmap::common;



static
void
checkRowCount(
    const unsigned rowCount,
    const unsigned individualCount,
    const char* label)
{
    if (rowCount == individualCount) return;

    std::ostringstream oss;
    oss << label << " has " << rowCount << " rows, phenotype matrix has " << individualCount << " individuals";
    BOOST_THROW_EXCEPTION(DimensionMismatchException(oss.str()));
}



/// rows of the design and the phenotypes are scaled by sqrt(w) so that the fit minimizes sum(w*r^2)
static
double
getRowMultiplier(
    const std::vector<double>& weights,
    const unsigned individualIndex)
{
    return (weights.empty() ? 1. : std::sqrt(weights[individualIndex]));
}



static
void
checkScanInputs(
    const PhenotypeMatrix& phenotypes,
    const CovariateMatrix& addcovar,
    const CovariateMatrix& intcovar,
    const std::vector<double>& weights)
{
    const unsigned individualCount(phenotypes.getIndividualCount());
    if (! addcovar.empty()) checkRowCount(addcovar.getIndividualCount(), individualCount, "Additive covariate matrix");
    if (! intcovar.empty()) checkRowCount(intcovar.getIndividualCount(), individualCount, "Interactive covariate matrix");
    if (! weights.empty()) checkRowCount(weights.size(), individualCount, "Weight vector");
    for (unsigned individualIndex(0); individualIndex<weights.size(); ++individualIndex)
    {
        const double weight(weights[individualIndex]);
        if ((weight >= 0.) && std::isfinite(weight)) continue;

        std::ostringstream oss;
        oss << "Weight of individual " << individualIndex << " must be finite and non-negative, found: " << weight;
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    for (unsigned individualIndex(0); individualIndex<individualCount; ++individualIndex)
    {
        for (unsigned phenotypeIndex(0); phenotypeIndex<phenotypes.getColumnCount(); ++phenotypeIndex)
        {
            if (! isMissingPhenotype(phenotypes.get(individualIndex, phenotypeIndex))) continue;

            std::ostringstream oss;
            oss << "Phenotype '" << phenotypes.getColumnName(phenotypeIndex) << "' is missing for individual "
                << individualIndex << ", individuals with missing phenotypes must be omitted before the scan";
            BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
        }
    }
}



/// phenotype matrix with each row multiplied by the individual's row multiplier
static
Eigen::MatrixXd
getWeightedPhenotypes(
    const PhenotypeMatrix& phenotypes,
    const std::vector<double>& weights)
{
    const unsigned individualCount(phenotypes.getIndividualCount());
    Eigen::MatrixXd y(individualCount, phenotypes.getColumnCount());
    for (unsigned individualIndex(0); individualIndex<individualCount; ++individualIndex)
    {
        const double rowScale(getRowMultiplier(weights, individualIndex));
        for (unsigned phenotypeIndex(0); phenotypeIndex<phenotypes.getColumnCount(); ++phenotypeIndex)
        {
            y(individualIndex, phenotypeIndex) = rowScale*phenotypes.get(individualIndex, phenotypeIndex);
        }
    }
    return y;
}



/// Least squares fit of every column of \p y on the design \p x
///
/// \param[out] rss residual sum of squares of each column of \p y
///
/// throws DegenerateDesignException if x does not have full column rank
static
void
fitLeastSquares(
    const Eigen::MatrixXd& x,
    const Eigen::MatrixXd& y,
    Eigen::RowVectorXd& rss)
{
    const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(x);
    if (qr.rank() < x.cols())
    {
        std::ostringstream oss;
        oss << "Design matrix with " << x.cols() << " columns has rank " << qr.rank();
        BOOST_THROW_EXCEPTION(DegenerateDesignException(oss.str()));
    }

    const Eigen::MatrixXd residuals(y - x*qr.solve(y));
    rss = residuals.colwise().squaredNorm();
}



std::vector<double>
scanoneHKNull(
    const PhenotypeMatrix& phenotypes,
    const CovariateMatrix& addcovar,
    const std::vector<double>& weights)
{
    static const CovariateMatrix noCovariates;
    checkScanInputs(phenotypes, addcovar, noCovariates, weights);

    const unsigned individualCount(phenotypes.getIndividualCount());
    const unsigned addcovarCount(addcovar.getColumnCount());

    Eigen::MatrixXd x(individualCount, 1+addcovarCount);
    for (unsigned individualIndex(0); individualIndex<individualCount; ++individualIndex)
    {
        const double rowScale(getRowMultiplier(weights, individualIndex));
        x(individualIndex, 0) = rowScale;
        for (unsigned covarIndex(0); covarIndex<addcovarCount; ++covarIndex)
        {
            x(individualIndex, 1+covarIndex) = rowScale*addcovar.get(individualIndex, covarIndex);
        }
    }

    Eigen::RowVectorXd rss;
    fitLeastSquares(x, getWeightedPhenotypes(phenotypes, weights), rss);
    return std::vector<double>(rss.data(), rss.data()+rss.size());
}



Eigen::MatrixXd
scanoneHK(
    const GenotypeProbabilityTensor& genotypeProbs,
    const PhenotypeMatrix& phenotypes,
    const CovariateMatrix& addcovar,
    const CovariateMatrix& intcovar,
    const std::vector<double>& weights,
    const unsigned baselineGenotypeIndex)
{
    checkScanInputs(phenotypes, addcovar, intcovar, weights);
    checkRowCount(genotypeProbs.getIndividualCount(), phenotypes.getIndividualCount(), "Genotype probability tensor");

    const unsigned genotypeCount(genotypeProbs.getGenotypeCount());
    if (baselineGenotypeIndex >= genotypeCount)
    {
        std::ostringstream oss;
        oss << "Baseline genotype index " << baselineGenotypeIndex << " is invalid for " << genotypeCount
            << " genotypes";
        BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
    }

    const unsigned individualCount(phenotypes.getIndividualCount());
    const unsigned positionCount(genotypeProbs.getPositionCount());
    const unsigned addcovarCount(addcovar.getColumnCount());
    const unsigned intcovarCount(intcovar.getColumnCount());
    const unsigned effectCount(genotypeCount-1);

    // design column layout: intercept, genotype effects, additive covariates, interactions
    const unsigned addcovarOffset(1+effectCount);
    const unsigned intcovarOffset(addcovarOffset+addcovarCount);
    const unsigned columnCount(intcovarOffset+intcovarCount*effectCount);

    const Eigen::MatrixXd y(getWeightedPhenotypes(phenotypes, weights));

    // columns other than the genotype effects are the same at every position
    Eigen::MatrixXd x(individualCount, columnCount);
    for (unsigned individualIndex(0); individualIndex<individualCount; ++individualIndex)
    {
        const double rowScale(getRowMultiplier(weights, individualIndex));
        x(individualIndex, 0) = rowScale;
        for (unsigned covarIndex(0); covarIndex<addcovarCount; ++covarIndex)
        {
            x(individualIndex, addcovarOffset+covarIndex) = rowScale*addcovar.get(individualIndex, covarIndex);
        }
    }

    Eigen::MatrixXd rss(positionCount, phenotypes.getColumnCount());
    Eigen::RowVectorXd positionRss;
    for (unsigned positionIndex(0); positionIndex<positionCount; ++positionIndex)
    {
        for (unsigned individualIndex(0); individualIndex<individualCount; ++individualIndex)
        {
            const double rowScale(getRowMultiplier(weights, individualIndex));
            const double* probRow(genotypeProbs.getRow(individualIndex, positionIndex));
            unsigned effectIndex(0);
            for (unsigned genotypeIndex(0); genotypeIndex<genotypeCount; ++genotypeIndex)
            {
                if (genotypeIndex == baselineGenotypeIndex) continue;
                const double effect(rowScale*probRow[genotypeIndex]);
                x(individualIndex, 1+effectIndex) = effect;
                for (unsigned covarIndex(0); covarIndex<intcovarCount; ++covarIndex)
                {
                    x(individualIndex, intcovarOffset+covarIndex*effectCount+effectIndex) =
                        effect*intcovar.get(individualIndex, covarIndex);
                }
                effectIndex++;
            }
        }

        try
        {
            fitLeastSquares(x, y, positionRss);
            rss.row(positionIndex) = positionRss;
        }
        catch (const DegenerateDesignException&)
        {
            rss.row(positionIndex).setConstant(std::numeric_limits<double>::quiet_NaN());
        }
    }

    return rss;
}



double
rssToLod(
    const double rss,
    const double rss0,
    const unsigned individualCount)
{
    if (rss == rss0) return 0.;
    return (individualCount/2.)*std::log10(rss0/rss);
}



Eigen::MatrixXd
rssToLod(
    const Eigen::MatrixXd& rss,
    const std::vector<double>& rss0,
    const unsigned individualCount)
{
    if (static_cast<size_t>(rss.cols()) != rss0.size())
    {
        std::ostringstream oss;
        oss << "RSS matrix has " << rss.cols() << " phenotypes, null model has " << rss0.size();
        BOOST_THROW_EXCEPTION(DimensionMismatchException(oss.str()));
    }

    const unsigned positionCount(rss.rows());
    const unsigned phenotypeCount(rss.cols());
    Eigen::MatrixXd lod(positionCount, phenotypeCount);
    for (unsigned positionIndex(0); positionIndex<positionCount; ++positionIndex)
    {
        for (unsigned phenotypeIndex(0); phenotypeIndex<phenotypeCount; ++phenotypeIndex)
        {
            lod(positionIndex, phenotypeIndex) = rssToLod(rss(positionIndex, phenotypeIndex), rss0[phenotypeIndex],
                                                          individualCount);
        }
    }
    return lod;
}



std::vector<ScanonePeak>
getPeaks(
    const Eigen::MatrixXd& lod,
    const std::vector<Marker>& positions)
{
    if (static_cast<size_t>(lod.rows()) != positions.size())
    {
        std::ostringstream oss;
        oss << "LOD matrix has " << lod.rows() << " positions, expected " << positions.size();
        BOOST_THROW_EXCEPTION(DimensionMismatchException(oss.str()));
    }

    const unsigned phenotypeCount(lod.cols());
    std::vector<ScanonePeak> peaks(phenotypeCount);
    for (unsigned phenotypeIndex(0); phenotypeIndex<phenotypeCount; ++phenotypeIndex)
    {
        ScanonePeak& peak(peaks[phenotypeIndex]);
        for (unsigned positionIndex(0); positionIndex<positions.size(); ++positionIndex)
        {
            const double value(lod(positionIndex, phenotypeIndex));
            if (std::isnan(value)) continue;
            if (peak.isDefined() && (value <= peak.lod)) continue;

            peak.positionIndex = positionIndex;
            peak.positionName = positions[positionIndex].name;
            peak.position = positions[positionIndex].position;
            peak.lod = value;
        }
    }
    return peaks;
}
