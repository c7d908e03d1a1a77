#pragma once
#include <Eigen/Dense>
namespace saxsred {
	using Vector  = Eigen::VectorXd;
	using Matrix  = Eigen::MatrixXd;
	using Frame   = Eigen::MatrixXd;   // one 2D detector image
	using MaskMap = Eigen::MatrixXi;   // non-zero == masked pixel
} // namespace saxsred
