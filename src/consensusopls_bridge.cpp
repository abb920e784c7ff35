// Bridge between R and the ConsensusOPLS C++ implementation.

#include <Rcpp.h>
#include <RcppEigen.h>
// [[Rcpp::depends(RcppEigen)]]

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "consensusopls/models/ConsensusOPLS.h"
#include "consensusopls/models/Predict.h"

using namespace Rcpp;
using namespace ConsensusOPLS;

namespace {

std::vector<DataBlock> blocksFromList(const List &data) {
    std::vector<DataBlock> blocks;
    CharacterVector list_names = data.hasAttribute("names") ? CharacterVector(data.names()) : CharacterVector(0);
    for (int i = 0; i < data.size(); i++) {
        NumericMatrix m = as<NumericMatrix>(data[i]);
        DataBlock block;
        if (list_names.size() > i) block.name = as<std::string>(list_names[i]);
        // Copy so the block owns its data independently of R's memory
        block.X = as<Eigen::MatrixXd>(m);
        List dimnames = m.hasAttribute("dimnames") ? List(m.attr("dimnames")) : List(0);
        if (dimnames.size() == 2 && !Rf_isNull(dimnames[1])) {
            block.variable_names = as<std::vector<std::string>>(dimnames[1]);
        }
        blocks.push_back(std::move(block));
    }
    return blocks;
}

Response responseFromR(SEXP Y) {
    if (Rf_isFactor(Y)) {
        IntegerVector codes(Y);
        CharacterVector levels = codes.attr("levels");
        std::vector<std::string> labels(codes.size());
        for (int i = 0; i < codes.size(); i++) labels[i] = as<std::string>(levels[codes[i] - 1]);
        return Response::fromLabels(labels);
    }
    if (Rf_isString(Y)) {
        return Response::fromLabels(as<std::vector<std::string>>(Y));
    }
    if (Rf_isMatrix(Y)) {
        return Response::fromMatrix(as<Eigen::MatrixXd>(NumericMatrix(Y)));
    }
    return Response::fromVector(as<Eigen::VectorXd>(NumericVector(Y)));
}

KernelSpec kernelFromR(const std::string &type, const NumericVector &params) {
    std::map<std::string, double> values;
    if (params.size() > 0) {
        CharacterVector names = params.names();
        for (int i = 0; i < params.size(); i++) values[as<std::string>(names[i])] = params[i];
    }
    return KernelSpec::fromTag(type, values);
}

List namedMatrices(const std::vector<Eigen::MatrixXd> &matrices, const std::vector<std::string> &names) {
    List out(matrices.size());
    for (std::size_t i = 0; i < matrices.size(); i++) out[i] = wrap(matrices[i]);
    out.names() = wrap(names);
    return out;
}

} // namespace

// [[Rcpp::export]]
List consensus_opls_fit_cpp(List data, SEXP Y, int maxPcomp, int maxOcomp,
                            std::string modelType, std::string cvType,
                            int nfold, int nMC, double cvFrac,
                            std::string kernelType, NumericVector kernelParams,
                            std::string preProcK, std::string preProcY,
                            int nperm, double seed, int mc_cores, bool verbose) {
    FitOptions options;
    options.max_pcomp = maxPcomp;
    options.max_ocomp = maxOcomp;
    options.model_type = parseModelType(modelType);
    options.cv_type = parseCVType(cvType);
    options.nfold = nfold;
    options.n_mc = nMC;
    options.cv_frac = cvFrac;
    options.kernel = kernelFromR(kernelType, kernelParams);
    // The kernel is either mean-centered or left as is
    Scaling kernel_scaling = parseScaling(preProcK);
    if (kernel_scaling != Scaling::None && kernel_scaling != Scaling::Center) {
        stop("preProcK must be 'mc' or 'no'");
    }
    options.kernel_centering = kernel_scaling == Scaling::Center;
    options.y_scaling = parseScaling(preProcY);
    options.n_perm = nperm;
    options.seed = static_cast<std::uint64_t>(seed);
    options.n_workers = mc_cores;
    options.verbose = verbose;

    ConsensusModel model = fitConsensusOPLS(blocksFromList(data), responseFromR(Y), options);
    for (const std::string &w : model.warnings()) Rcpp::warning("%s", w.c_str());

    const CVResult &cv = model.crossValidation();
    const SelectionResult &sel = model.selection();
    std::vector<std::string> block_names = model.blockNames();

    // Convert test indices from 0-indexed to 1-indexed for R
    IntegerVector test_index(cv.test_index.begin(), cv.test_index.end());
    for (int i = 0; i < test_index.size(); i++) test_index[i] += 1;

    List cv_list = List::create(
        Named("AllYhat") = cv.all_yhat,
        Named("cvTestIndex") = test_index,
        Named("Q2Yhat") = cv.q2_yhat,
        Named("Q2YhatVars") = cv.q2_yhat_vars,
        Named("DQ2") = sel.dq2,
        Named("PRESSD") = sel.pressd,
        Named("curve") = sel.curve,
        Named("nOcompOpt") = sel.n_ocomp,
        Named("failures") = static_cast<int>(cv.failures.size())
    );
    if (model.modelType() == ModelType::Discriminant) {
        cv_list["sensitivity"] = sel.cv_classification.sensitivity;
        cv_list["specificity"] = sel.cv_classification.specificity;
        cv_list["confusion"] = wrap(Eigen::MatrixXi(sel.cv_classification.confusion));
    }

    List result = List::create(
        Named("modelType") = modelTypeName(model.modelType()),
        Named("nPcomp") = model.nPcomp(),
        Named("nOcomp") = model.nOcomp(),
        Named("blockNames") = block_names,
        Named("RV") = model.rvWeights(),
        Named("kernelNorms") = model.kernelNorms(),
        Named("normKernels") = namedMatrices(model.normalizedKernels(), block_names),
        Named("lambda") = model.lambda(),
        Named("blockContribution") = model.blockContribution(),
        Named("componentNames") = model.componentNames(),
        Named("scores") = model.scores(),
        Named("loadings") = namedMatrices(model.loadings(), block_names),
        Named("VIP") = namedMatrices(model.vip(), block_names),
        Named("R2X") = model.R2X(),
        Named("R2XO") = model.R2XO(),
        Named("R2XC") = model.R2XC(),
        Named("R2Yhat") = model.R2Yhat(),
        Named("R2Y") = model.R2Y(),
        Named("fitted") = model.fittedValues()
    );
    result["cv"] = cv_list;
    result["classNames"] = model.classNames();
    result["warnings"] = model.warnings();
    if (model.permutation()) {
        const PermutationStats &perm = *model.permutation();
        result["permStats"] = List::create(
            Named("R2Yhat") = perm.r2_yhat,
            Named("Q2Yhat") = perm.q2_yhat,
            Named("DQ2Yhat") = perm.dq2,
            Named("y.cor") = perm.y_correlation,
            Named("pvalue.R2Yhat") = perm.p_r2_yhat,
            Named("pvalue.Q2Yhat") = perm.p_q2_yhat,
            Named("pvalue.DQ2Yhat") = perm.p_dq2
        );
    }
    result["model"] = XPtr<ConsensusModel>(new ConsensusModel(std::move(model)), true);
    return result;
}

// [[Rcpp::export]]
List consensus_opls_predict_cpp(SEXP model_ptr, List newdata) {
    XPtr<ConsensusModel> model(model_ptr);
    ConsensusPrediction pred = predictConsensusOPLS(*model, blocksFromList(newdata));

    List result = List::create(
        Named("Yhat") = pred.Yhat,
        Named("predictiveScores") = pred.Tp,
        Named("orthoScores") = pred.To
    );
    if (model->modelType() == ModelType::Discriminant) {
        result["class"] = pred.class_labels;
        result["margin"] = pred.margin;
        result["probabilities"] = pred.probabilities;
    }
    return result;
}
